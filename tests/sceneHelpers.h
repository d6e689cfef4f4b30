#ifndef sceneHelpers_h_b5n2qk7w
#define sceneHelpers_h_b5n2qk7w

#include "creature.h"
#include "transform.h"

namespace bonemarch
{
	// every primitive moved far away from the origin, out of reach of rays marched near it
	inline Scene emptyScene()
	{
		Scene scene = defaultScene();
		const Mat4 far = matTranslation(Vec3(0, -500, 0));
		for (Primitive &j : scene.joints)
			j.worldToLocal = far;
		for (EdgePrimitive &e : scene.edges)
			e.worldToLocal = far;
		scene.ground.worldToLocal = far;
		return scene;
	}

	inline Primitive sphere(const Vec3 &center, Real radius, Real smoothing = 0.01)
	{
		Primitive p;
		p.kind = PrimitiveKindEnum::Sphere;
		p.size = Vec3(radius);
		p.smoothing = smoothing;
		p.worldToLocal = matTranslation(-center);
		return p;
	}
}

#endif
