#include "sdf.h"

namespace bonemarch
{
	Real sdfRoundedBox(const Vec3 &pos, const Vec3 &size, Real rounding)
	{
		return sdfBox(pos, size * 0.5 - rounding) - rounding;
	}

	Real sdfRoundedCylinder(const Vec3 &pos, Real height, Real radius, Real rounding)
	{
		return sdfCylinder(pos, height * 0.5 - rounding, radius - rounding) - rounding;
	}

	Real sdfRoundedCapsule(const Vec3 &pos, Real height, Real radius, Real rounding)
	{
		// the segment shrinks by as much as the radius grows, the tips stay in place
		return sdfCapsule(pos, height - rounding * 2, radius + rounding);
	}
}
