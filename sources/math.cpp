#include "math.h"

namespace bonemarch
{
	Real smoothMinExponential(Real a, Real b, Real k)
	{
		CAGE_ASSERT(k > 0);
		return -log(powE(-k * a) + powE(-k * b)) / k;
	}

	Real smoothMin(Real a, Real b, Real k)
	{
		// https://www.shadertoy.com/view/3ssGWj
		if (k <= 0)
			return min(a, b);
		const Real h = saturate((b - a) / k * 0.5 + 0.5);
		return interpolate(b, a, h) - k * h * (1 - h);
	}

	Real smoothMinPower(Real a, Real b, Real k)
	{
		CAGE_ASSERT(a >= 0 && b >= 0 && k > 0);
		a = pow(a, k);
		b = pow(b, k);
		return pow((a * b) / (a + b), 1 / k);
	}

	Real csgUnion(Real a, Real b)
	{
		return min(a, b);
	}

	Real csgIntersection(Real a, Real b)
	{
		return max(a, b);
	}

	Real csgDifference(Real a, Real b)
	{
		return max(a, -b);
	}

	bool isUnit(const Vec3 &v)
	{
		return abs(length(v) - 1) < 1e-3;
	}

	Vec3 anyPerpendicular(const Vec3 &a)
	{
		CAGE_ASSERT(isUnit(a));
		Vec3 b = Vec3(1, 0, 0);
		if (abs(dot(a, b)) > 0.9)
			b = Vec3(0, 1, 0);
		return normalize(cross(a, b));
	}
}
