#ifndef math_h_n4v8ke2w
#define math_h_n4v8ke2w

#include <cage-core/math.h>

namespace bonemarch
{
	using namespace cage;

	// smooth minimums; all satisfy result <= min(a, b)
	Real smoothMinExponential(Real a, Real b, Real k);
	Real smoothMin(Real a, Real b, Real k);
	Real smoothMinPower(Real a, Real b, Real k); // a and b must be non-negative

	Real csgUnion(Real a, Real b);
	Real csgIntersection(Real a, Real b);
	Real csgDifference(Real a, Real b);

	bool isUnit(const Vec3 &v);
	Vec3 anyPerpendicular(const Vec3 &a);
}

#endif
