#ifndef renderer_h_u6fb3m0c
#define renderer_h_u6fb3m0c

#include "creature.h"

namespace cage
{
	class Image;
}

namespace bonemarch
{
	constexpr uint32 MarchMaxSteps = 255;
	constexpr Real MarchEpsilon = 1e-4;
	constexpr Real MarchStart = 0;
	constexpr Real MarchEnd = 100;

	// camera
	Vec3 rayDirection(Real fovDegrees, const Vec2 &fragCoord); // view space, looking down -z
	Mat4 viewMatrix(const Vec3 &eye, const Vec3 &target, const Vec3 &up); // view-space directions to world-space directions
	Vec3 cameraRay(const Camera &camera, const Vec2 &fragCoord); // world space, unit length

	// returns end when nothing was hit
	Real rayMarch(const Scene &scene, const Vec3 &eye, const Vec3 &dir, Real start = MarchStart, Real end = MarchEnd);
	Vec3 estimateNormal(const Scene &scene, const Vec3 &pos); // zero vector where the gradient vanishes
	Real ambientOcclusion(const Scene &scene, const Light &light, const Vec3 &pos, const Vec3 &normal);

	// shading
	Vec3 phongContribution(const Light &light, const Vec3 &objectColor, const Vec3 &pos, const Vec3 &normal, const Vec3 &eye);
	Vec4 shadeRay(const Frame &frame, const Vec3 &eye, const Vec3 &dir);
	Vec4 renderPixel(const Frame &frame, const Vec2 &fragCoord);

	Vec2 pixelToFragCoord(uint32 x, uint32 y, uint32 width, uint32 height);
	Holder<Image> renderFrame(const Frame &frame, uint32 width, uint32 height);
}

#endif
