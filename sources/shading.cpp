#include "renderer.h"

namespace bonemarch
{
	namespace
	{
		Vec3 reflect(const Vec3 &i, const Vec3 &n)
		{
			return i - 2 * dot(n, i) * n;
		}
	}

	Vec3 phongContribution(const Light &light, const Vec3 &objectColor, const Vec3 &pos, const Vec3 &normal, const Vec3 &eye)
	{
		if (lengthSquared(normal) == 0)
			return Vec3();
		const Vec3 L = normalize(light.position - pos);
		const Vec3 V = normalize(eye - pos);
		const Vec3 R = normalize(reflect(-L, normal));
		const Real dotLN = dot(L, normal);
		const Real dotRV = dot(R, V);
		if (dotLN < 0)
			return Vec3(); // facing away from the light
		if (dotRV < 0)
			return light.diffuseScale * objectColor * dotLN; // reflection points away from the eye
		return light.diffuseScale * objectColor * dotLN + light.specularScale * objectColor * pow(dotRV, light.specularPower);
	}

	Vec4 shadeRay(const Frame &frame, const Vec3 &eye, const Vec3 &dir)
	{
		const Real dist = rayMarch(frame.scene, eye, dir);
		if (dist >= MarchEnd)
			return Vec4(frame.palette.background, 1);

		const Vec3 p = eye + dist * dir;
		const Vec3 n = estimateNormal(frame.scene, p);
		const Vec3 ambient = frame.palette.object * frame.light.ambientScale;
		const Vec3 color = ambient + phongContribution(frame.light, frame.palette.object, p, n, eye);

		// occlusion pulls the color towards the background, not towards black
		const Real occlusion = ambientOcclusion(frame.scene, frame.light, p, n);
		const Real strength = (1 - occlusion) * frame.light.occlusionScale;
		return Vec4(color - strength * (color - frame.palette.background), 1);
	}

	Vec4 renderPixel(const Frame &frame, const Vec2 &fragCoord)
	{
		return shadeRay(frame, frame.camera.position, cameraRay(frame.camera, fragCoord));
	}
}
