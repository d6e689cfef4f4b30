#include "renderer.h"

namespace bonemarch
{
	Real rayMarch(const Scene &scene, const Vec3 &eye, const Vec3 &dir, Real start, Real end)
	{
		Real depth = start;
		for (uint32 i = 0; i < MarchMaxSteps; i++)
		{
			const Real dist = sceneDistance(scene, eye + depth * dir);
			if (dist < MarchEpsilon)
				return depth;
			depth += dist;
			if (depth >= end)
				return end;
		}
		return end;
	}

	Vec3 estimateNormal(const Scene &scene, const Vec3 &p)
	{
		const Real e = MarchEpsilon;
		const Vec3 dx = Vec3(e, 0, 0);
		const Vec3 dy = Vec3(0, e, 0);
		const Vec3 dz = Vec3(0, 0, e);
		const Vec3 g = Vec3(sceneDistance(scene, p + dx) - sceneDistance(scene, p - dx), sceneDistance(scene, p + dy) - sceneDistance(scene, p - dy), sceneDistance(scene, p + dz) - sceneDistance(scene, p - dz));
		const Real l = length(g);
		if (!valid(l) || l < 1e-12)
			return Vec3();
		return g / l;
	}

	Real ambientOcclusion(const Scene &scene, const Light &light, const Vec3 &pos, const Vec3 &normal)
	{
		// single directional probe along the normal
		constexpr Real minT = 0.01;
		const Real maxT = light.occlusionRange;
		if (!(maxT > minT) || !(light.occlusionStep > 0))
			return 1;
		Real factor = 1;
		for (Real t = minT; t < maxT; t += light.occlusionStep)
		{
			const Real dist = sceneDistance(scene, pos + normal * t);
			if (dist < t - MarchEpsilon)
			{
				const Real normT = (t - minT) / (maxT - minT);
				factor = factor * normT + factor * (dist / t) * (1 - normT);
			}
			if (factor <= 0)
				break;
		}
		return factor;
	}
}
