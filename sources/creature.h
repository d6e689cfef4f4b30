#ifndef creature_h_p2w7ef9a
#define creature_h_p2w7ef9a

#include <array>

#include <cage-core/math.h>

namespace bonemarch
{
	using namespace cage;

	enum class PrimitiveKindEnum : uint32
	{
		Sphere = 0,
		Box = 1,
		Capsule = 2,
		Cylinder = 3,
		_Total
	};

	Stringizer &operator+(Stringizer &str, const PrimitiveKindEnum &other);
	PrimitiveKindEnum primitiveKindFromString(const String &name); // accepts names and numeric codes

	struct Primitive
	{
		Mat4 worldToLocal; // inverse of the placement, rotation and translation only
		Vec3 size = Vec3(0.1); // sphere: [0] is radius; box: full extents; capsule and cylinder: [0] is radius, [2] is height
		Real rounding = 0.01; // ignored by spheres
		Real smoothing = 0.01; // blending into the running union
		PrimitiveKindEnum kind = PrimitiveKindEnum::Sphere;
	};

	struct EdgePrimitive : public Primitive
	{
		Real length = 1; // multiplies size[2]
	};

	struct Scene
	{
		static constexpr uint32 JointsCount = 28;
		static constexpr uint32 EdgesCount = 27;

		std::array<Primitive, JointsCount> joints;
		std::array<EdgePrimitive, EdgesCount> edges;
		Primitive ground;
		Real jointEdgeSmoothing = 0;
		Real groundSmoothing = 0.01;
	};

	struct Camera
	{
		Vec3 position = Vec3(1, 0, 0);
		Vec3 target; // the creature is centered at the origin
		Vec3 up = Vec3(0, 0, -1);
		Real fov = 45; // vertical, degrees
	};

	struct Light
	{
		Vec3 position = Vec3(1, 0, 0);
		Real ambientScale = 0.5;
		Real diffuseScale = 0.5;
		Real specularScale = 0.5;
		Real specularPower = 10;
		Real occlusionScale = 1;
		Real occlusionRange = 3;
		Real occlusionStep = 1;
	};

	struct Palette
	{
		Vec3 background;
		Vec3 object = Vec3(1, 0, 0);
	};

	// immutable snapshot shared by all pixels of one frame
	struct Frame
	{
		Scene scene;
		Camera camera;
		Light light;
		Palette palette;
	};

	Scene defaultScene();

	Real primitiveDistance(const Primitive &prim, const Vec3 &worldPos, Real lengthScale = 1);
	Real sceneDistance(const Scene &scene, const Vec3 &pos);
	void validateScene(const Scene &scene);
	void validateFrame(const Frame &frame); // includes the scene
}

#endif
