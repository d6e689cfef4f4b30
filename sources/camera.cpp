#include "math.h"
#include "renderer.h"

namespace bonemarch
{
	Vec3 rayDirection(Real fovDegrees, const Vec2 &fragCoord)
	{
		const Real z = 1 / tan(Rads(Degs(fovDegrees)) * 0.5);
		return normalize(Vec3(fragCoord[0], fragCoord[1], -z));
	}

	Mat4 viewMatrix(const Vec3 &eye, const Vec3 &target, const Vec3 &up)
	{
		const Vec3 f = normalize(target - eye);
		Vec3 s = cross(f, up);
		if (lengthSquared(s) < 1e-12)
			s = anyPerpendicular(f); // looking along the up vector
		else
			s = normalize(s);
		const Vec3 u = cross(s, f);
		return Mat4(s[0], s[1], s[2], 0, u[0], u[1], u[2], 0, -f[0], -f[1], -f[2], 0, 0, 0, 0, 1);
	}

	Vec3 cameraRay(const Camera &camera, const Vec2 &fragCoord)
	{
		const Vec3 viewDir = rayDirection(camera.fov, fragCoord);
		const Mat4 view = viewMatrix(camera.position, camera.target, camera.up);
		const Vec4 r = view * Vec4(viewDir, 0);
		return Vec3(r[0], r[1], r[2]);
	}
}
