#include <gtest/gtest.h>

#include "renderer.h"
#include "sceneHelpers.h"

using namespace bonemarch;

namespace
{
	Scene unitSphereScene()
	{
		Scene scene = emptyScene();
		scene.joints[0] = sphere(Vec3(), 1);
		return scene;
	}
}

TEST(Marching, HitsSphereInFront)
{
	const Scene scene = unitSphereScene();
	const Real d = rayMarch(scene, Vec3(0, 0, 5), Vec3(0, 0, -1));
	EXPECT_NEAR(d.value, 4, 0.01);
}

TEST(Marching, HitsSphereObliquely)
{
	const Scene scene = unitSphereScene();
	const Vec3 eye = Vec3(0, 0, 5);
	const Vec3 dir = normalize(Vec3(0.5, 0, 0) - eye);
	const Real d = rayMarch(scene, eye, dir);
	ASSERT_LT(d.value, MarchEnd.value);
	EXPECT_NEAR(length(eye + d * dir).value, 1, 0.01);
}

TEST(Marching, MissReturnsEnd)
{
	const Scene scene = unitSphereScene();
	EXPECT_EQ(rayMarch(scene, Vec3(0, 0, 5), Vec3(0, 0, 1)).value, MarchEnd.value);
	EXPECT_EQ(rayMarch(scene, Vec3(0, 0, 5), normalize(Vec3(1, 0, -1))).value, MarchEnd.value);
}

TEST(Marching, StepsExhaustedReturnsEnd)
{
	// a ray running parallel to a flat face just above epsilon advances by tiny steps only
	Scene scene = emptyScene();
	scene.ground.kind = PrimitiveKindEnum::Box;
	scene.ground.size = Vec3(1000, 1000, 1);
	scene.ground.rounding = 0;
	scene.ground.worldToLocal = matTranslation(Vec3(0, 0, 0.5)); // top face at z = 0
	EXPECT_EQ(rayMarch(scene, Vec3(0, 0, 2e-4), Vec3(1, 0, 0)).value, MarchEnd.value);
}

TEST(Marching, CustomEnd)
{
	const Scene scene = unitSphereScene();
	EXPECT_EQ(rayMarch(scene, Vec3(0, 0, 5), Vec3(0, 0, 1), 0, 20).value, 20);
	EXPECT_EQ(rayMarch(scene, Vec3(0, 0, 5), Vec3(0, 0, -1), 0, 3).value, 3);
}

TEST(Marching, StartInsideReportsImmediateHit)
{
	const Scene scene = unitSphereScene();
	EXPECT_NEAR(rayMarch(scene, Vec3(0, 0, 5), Vec3(0, 0, -1), 5).value, 5, 1e-5);
}

TEST(Normals, SphereNormalPointsOutwards)
{
	const Scene scene = unitSphereScene();
	const Vec3 points[] = { Vec3(1, 0, 0), Vec3(0, -1, 0), normalize(Vec3(1, 1, 1)) };
	for (const Vec3 &p : points)
	{
		const Vec3 n = estimateNormal(scene, p);
		EXPECT_NEAR(dot(n, p).value, 1, 1e-2);
		EXPECT_NEAR(length(n).value, 1, 1e-4);
	}
}

TEST(Normals, FlatGradientGivesZeroVector)
{
	// the gradient vanishes at the center of a sphere
	const Scene scene = unitSphereScene();
	const Vec3 n = estimateNormal(scene, Vec3());
	EXPECT_EQ(lengthSquared(n).value, 0);
}

TEST(Occlusion, OpenSurfaceIsUnoccluded)
{
	const Scene scene = unitSphereScene();
	Light light;
	light.occlusionRange = 3;
	light.occlusionStep = 0.5;
	EXPECT_NEAR(ambientOcclusion(scene, light, Vec3(1, 0, 0), Vec3(1, 0, 0)).value, 1, 1e-5);
}

TEST(Occlusion, NearbyGeometryOccludes)
{
	Scene scene = unitSphereScene();
	scene.joints[1] = sphere(Vec3(2.2, 0, 0), 0.5);
	Light light;
	light.occlusionRange = 3;
	light.occlusionStep = 0.25;
	const Real occlusion = ambientOcclusion(scene, light, Vec3(1, 0, 0), Vec3(1, 0, 0));
	EXPECT_LT(occlusion.value, 1);
}

TEST(Occlusion, FirstOccludedSampleUsesDistanceRatio)
{
	// a flat ground right above the surface: the first probe at t = 0.01 is fully weighted by dist / t
	Scene scene = emptyScene();
	scene.ground.kind = PrimitiveKindEnum::Box;
	scene.ground.size = Vec3(100, 100, 1);
	scene.ground.rounding = 0;
	scene.ground.worldToLocal = matTranslation(Vec3(0, 0, -0.505)); // bottom face at z = 0.005
	Light light;
	light.occlusionRange = 1;
	light.occlusionStep = 1;
	const Real occlusion = ambientOcclusion(scene, light, Vec3(), Vec3(0, 0, 1));
	EXPECT_NEAR(occlusion.value, -0.5, 1e-3);
}

TEST(Occlusion, DegenerateRangeIsUnoccluded)
{
	const Scene scene = unitSphereScene();
	Light light;
	light.occlusionRange = 0;
	EXPECT_EQ(ambientOcclusion(scene, light, Vec3(1, 0, 0), Vec3(1, 0, 0)).value, 1);
}
