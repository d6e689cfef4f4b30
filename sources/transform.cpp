#include "math.h"
#include "transform.h"

namespace bonemarch
{
	Mat4 matTranslation(const Vec3 &offset)
	{
		return Mat4(1, 0, 0, 0, 0, 1, 0, 0, 0, 0, 1, 0, offset[0], offset[1], offset[2], 1);
	}

	Mat4 matRotationX(Rads angle)
	{
		const Real s = sin(angle);
		const Real c = cos(angle);
		return Mat4(1, 0, 0, 0, 0, c, s, 0, 0, -s, c, 0, 0, 0, 0, 1);
	}

	Mat4 matRotationY(Rads angle)
	{
		const Real s = sin(angle);
		const Real c = cos(angle);
		return Mat4(c, 0, -s, 0, 0, 1, 0, 0, s, 0, c, 0, 0, 0, 0, 1);
	}

	Mat4 matRotationZ(Rads angle)
	{
		const Real s = sin(angle);
		const Real c = cos(angle);
		return Mat4(c, s, 0, 0, -s, c, 0, 0, 0, 0, 1, 0, 0, 0, 0, 1);
	}

	Mat4 matRotation(const Vec3 &axis_, Rads angle)
	{
		// rodrigues
		const Vec3 axis = normalize(axis_);
		const Real s = sin(angle);
		const Real c = cos(angle);
		const Real t = 1 - c;
		const Real x = axis[0];
		const Real y = axis[1];
		const Real z = axis[2];
		return Mat4(
			// clang-format off
			t * x * x + c,     t * x * y + s * z, t * x * z - s * y, 0,
			t * x * y - s * z, t * y * y + c,     t * y * z + s * x, 0,
			t * x * z + s * y, t * y * z - s * x, t * z * z + c,     0,
			0,                 0,                 0,                 1
			// clang-format on
		);
	}

	Mat4 matRigidInverse(const Mat4 &m)
	{
		const Vec3 t = Vec3(m[12], m[13], m[14]);
		const Vec3 c0 = Vec3(m[0], m[1], m[2]);
		const Vec3 c1 = Vec3(m[4], m[5], m[6]);
		const Vec3 c2 = Vec3(m[8], m[9], m[10]);
		return Mat4(
			// clang-format off
			m[0], m[4], m[8], 0,
			m[1], m[5], m[9], 0,
			m[2], m[6], m[10], 0,
			-dot(c0, t), -dot(c1, t), -dot(c2, t), 1
			// clang-format on
		);
	}

	Mat4 matWorldToLocal(const Vec3 &position, const Vec3 &axis, Rads angle)
	{
		const Mat4 placement = matTranslation(position) * matRotation(axis, angle);
		return matRigidInverse(placement);
	}

	Vec3 transformPoint(const Mat4 &m, const Vec3 &p)
	{
		const Vec4 r = m * Vec4(p, 1);
		return Vec3(r[0], r[1], r[2]);
	}

	Vec3 transformDirection(const Mat4 &m, const Vec3 &d)
	{
		const Vec4 r = m * Vec4(d, 0);
		return Vec3(r[0], r[1], r[2]);
	}
}
