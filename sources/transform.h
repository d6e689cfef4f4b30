#ifndef transform_h_k3s8vd1q
#define transform_h_k3s8vd1q

#include <cage-core/math.h>

namespace bonemarch
{
	using namespace cage;

	// column-major homogeneous matrices
	Mat4 matTranslation(const Vec3 &offset);
	Mat4 matRotationX(Rads angle);
	Mat4 matRotationY(Rads angle);
	Mat4 matRotationZ(Rads angle);
	Mat4 matRotation(const Vec3 &axis, Rads angle);

	// inverse of a matrix composed of rotation and translation only
	Mat4 matRigidInverse(const Mat4 &m);

	// world-to-local matrix of a primitive placed at position and rotated around axis by angle
	Mat4 matWorldToLocal(const Vec3 &position, const Vec3 &axis, Rads angle);

	Vec3 transformPoint(const Mat4 &m, const Vec3 &p);
	Vec3 transformDirection(const Mat4 &m, const Vec3 &d);
}

#endif
