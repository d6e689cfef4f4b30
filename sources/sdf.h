#ifndef sdf_h_q7m2cx5t
#define sdf_h_q7m2cx5t

#include <cage-core/signedDistanceFunctions.h>

namespace bonemarch
{
	using namespace cage;

	// all shapes are centered at the origin; cylinders and capsules are aligned with the z axis
	// sizes are full extents, heights are full heights, the rounding is carved from inside the extents
	// plain shapes come from cage: sdfSphere, sdfBox (half extents), sdfCylinder (half height), sdfCapsule (segment length)

	Real sdfRoundedBox(const Vec3 &pos, const Vec3 &size, Real rounding);
	Real sdfRoundedCylinder(const Vec3 &pos, Real height, Real radius, Real rounding);
	Real sdfRoundedCapsule(const Vec3 &pos, Real height, Real radius, Real rounding);
}

#endif
