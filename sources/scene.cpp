#include "creature.h"
#include "math.h"
#include "sdf.h"
#include "transform.h"

#include <cage-core/string.h>

namespace bonemarch
{
	namespace
	{
		constexpr const char *const primitiveKindNames[] = {
			"sphere",
			"box",
			"capsule",
			"cylinder",
		};

		static_assert((uint32)PrimitiveKindEnum::_Total == sizeof(primitiveKindNames) / sizeof(primitiveKindNames[0]), "number of kinds and names must match");

		// stands in for infinity as the seed of every union
		constexpr Real FarDistance = 1000;

		bool validMatrix(const Mat4 &m)
		{
			for (uint32 i = 0; i < 16; i++)
				if (!valid(m[i]))
					return false;
			return true;
		}

		Real roundingLimit(PrimitiveKindEnum kind, const Vec3 &size)
		{
			switch (kind)
			{
				case PrimitiveKindEnum::Box:
					return min(min(size[0], size[1]), size[2]) * 0.5;
				case PrimitiveKindEnum::Capsule:
					return size[2] * 0.5;
				case PrimitiveKindEnum::Cylinder:
					return min(size[0], size[2] * 0.5);
				default:
					return Real::Infinity();
			}
		}

		void validatePrimitive(const Primitive &prim, Real lengthScale)
		{
			if ((uint32)prim.kind >= (uint32)PrimitiveKindEnum::_Total)
				CAGE_THROW_ERROR(Exception, "invalid primitive kind");
			if (!validMatrix(prim.worldToLocal))
				CAGE_THROW_ERROR(Exception, "invalid primitive transformation");
			if (!valid(prim.size) || !valid(prim.rounding) || !valid(prim.smoothing) || !valid(lengthScale))
				CAGE_THROW_ERROR(Exception, "invalid primitive parameters");
			if (prim.size[0] < 0 || prim.size[1] < 0 || prim.size[2] < 0 || lengthScale < 0)
				CAGE_THROW_ERROR(Exception, "negative primitive size");
			if (prim.rounding < 0)
				CAGE_THROW_ERROR(Exception, "negative primitive rounding");
			if (prim.smoothing < 0)
				CAGE_THROW_ERROR(Exception, "negative primitive smoothing");
			const Vec3 size = Vec3(prim.size[0], prim.size[1], prim.size[2] * lengthScale);
			const Real limit = roundingLimit(prim.kind, size);
			if (prim.rounding > limit)
			{
				CAGE_LOG_THROW(Stringizer() + "kind: " + prim.kind + ", size: " + size + ", rounding: " + prim.rounding + ", limit: " + limit);
				CAGE_THROW_ERROR(Exception, "primitive rounding exceeds its size");
			}
		}
	}

	Stringizer &operator+(Stringizer &str, const PrimitiveKindEnum &other)
	{
		if ((uint32)other < (uint32)PrimitiveKindEnum::_Total)
			return str + primitiveKindNames[(uint32)other];
		return str + "unknown";
	}

	PrimitiveKindEnum primitiveKindFromString(const String &name_)
	{
		const String name = toLower(trim(name_));
		for (uint32 i = 0; i < (uint32)PrimitiveKindEnum::_Total; i++)
			if (name == primitiveKindNames[i])
				return (PrimitiveKindEnum)i;
		if (isDigitsOnly(name) && !name.empty())
		{
			const uint32 code = toUint32(name);
			if (code < (uint32)PrimitiveKindEnum::_Total)
				return (PrimitiveKindEnum)code;
		}
		CAGE_LOG_THROW(Stringizer() + "primitive: '" + name_ + "'");
		CAGE_THROW_ERROR(Exception, "unknown primitive kind");
	}

	Scene defaultScene()
	{
		Scene scene;
		for (EdgePrimitive &e : scene.edges)
		{
			e.size = Vec3(0.01, 0.01, 1);
			e.rounding = 0.1;
		}
		return scene;
	}

	Real primitiveDistance(const Primitive &prim, const Vec3 &worldPos, Real lengthScale)
	{
		const Vec3 p = transformPoint(prim.worldToLocal, worldPos);
		switch (prim.kind)
		{
			case PrimitiveKindEnum::Sphere:
				return sdfSphere(p, prim.size[0]);
			case PrimitiveKindEnum::Box:
				return sdfRoundedBox(p, Vec3(prim.size[0], prim.size[1], prim.size[2] * lengthScale), prim.rounding);
			case PrimitiveKindEnum::Capsule:
				return sdfRoundedCapsule(p, prim.size[2] * lengthScale, prim.size[0], prim.rounding);
			case PrimitiveKindEnum::Cylinder:
				return sdfRoundedCylinder(p, prim.size[2] * lengthScale, prim.size[0], prim.rounding);
			default:
				return FarDistance;
		}
	}

	Real sceneDistance(const Scene &scene, const Vec3 &pos)
	{
		Real joints = FarDistance;
		for (const Primitive &j : scene.joints)
			joints = smoothMin(joints, primitiveDistance(j, pos), j.smoothing);

		Real edges = FarDistance;
		for (const EdgePrimitive &e : scene.edges)
			edges = smoothMin(edges, primitiveDistance(e, pos, e.length), e.smoothing);

		const Real ground = smoothMin(FarDistance, primitiveDistance(scene.ground, pos), scene.ground.smoothing);

		const Real body = smoothMin(joints, edges, scene.jointEdgeSmoothing);
		return smoothMin(body, ground, scene.groundSmoothing);
	}

	void validateScene(const Scene &scene)
	{
		for (uint32 i = 0; i < Scene::JointsCount; i++)
		{
			try
			{
				validatePrimitive(scene.joints[i], 1);
			}
			catch (...)
			{
				CAGE_LOG_THROW(Stringizer() + "joint: " + i);
				throw;
			}
		}
		for (uint32 i = 0; i < Scene::EdgesCount; i++)
		{
			try
			{
				validatePrimitive(scene.edges[i], scene.edges[i].length);
			}
			catch (...)
			{
				CAGE_LOG_THROW(Stringizer() + "edge: " + i);
				throw;
			}
		}
		try
		{
			validatePrimitive(scene.ground, 1);
		}
		catch (...)
		{
			CAGE_LOG_THROW("ground");
			throw;
		}
		if (!valid(scene.jointEdgeSmoothing) || scene.jointEdgeSmoothing < 0)
			CAGE_THROW_ERROR(Exception, "invalid joint-edge smoothing");
		if (!valid(scene.groundSmoothing) || scene.groundSmoothing < 0)
			CAGE_THROW_ERROR(Exception, "invalid ground smoothing");
	}

	void validateFrame(const Frame &frame)
	{
		const Camera &c = frame.camera;
		if (!valid(c.position) || !valid(c.target) || !valid(c.up))
			CAGE_THROW_ERROR(Exception, "invalid camera placement");
		if (!(c.fov > 0 && c.fov < 180))
		{
			CAGE_LOG_THROW(Stringizer() + "fov: " + c.fov);
			CAGE_THROW_ERROR(Exception, "camera field of view must be between 0 and 180 degrees");
		}
		if (lengthSquared(c.target - c.position) == 0)
			CAGE_THROW_ERROR(Exception, "camera position and target must differ");
		validateScene(frame.scene);
	}
}
