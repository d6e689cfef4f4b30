#include <type_traits>

#include "frameConfig.h"
#include "transform.h"

#include <cage-core/ini.h>
#include <cage-core/string.h>

namespace bonemarch
{
	namespace
	{
		Vec3 getVec3(Ini *ini, const String &section, const String &item, const Vec3 &defaul)
		{
			if (ini->itemExists(section, item))
				return Vec3::parse(ini->getString(section, item));
			return defaul;
		}

		Vec3 parseSize(const String &value)
		{
			if (isPattern(value, "", ",", ""))
				return Vec3::parse(value);
			return Vec3(toFloat(value)); // single value applies to all extents
		}

		void loadShape(Ini *ini, const String &section, Primitive &prim)
		{
			if (ini->itemExists(section, "primitive"))
				prim.kind = primitiveKindFromString(ini->getString(section, "primitive"));
			if (ini->itemExists(section, "size"))
				prim.size = parseSize(ini->getString(section, "size"));
			prim.rounding = ini->getFloat(section, "rounding", prim.rounding.value);
		}

		void loadPlacement(Ini *ini, const String &section, Primitive &prim)
		{
			const Vec3 position = getVec3(ini, section, "position", Vec3());
			const Vec3 axis = getVec3(ini, section, "axis", Vec3(0, 0, 1));
			const Real angle = ini->getFloat(section, "angle", 0);
			if (!(lengthSquared(axis) > 0))
				CAGE_THROW_ERROR(Exception, "rotation axis must not be zero");
			prim.worldToLocal = matWorldToLocal(position, axis, Rads(Degs(angle)));
		}

		void skipSection(Ini *ini, const String &section)
		{
			for (const String &item : ini->items(section))
				ini->getString(section, item);
		}

		template<class T, std::size_t N>
		void loadCollection(Ini *ini, std::array<T, N> &items, const String &bulkName, const String &itemName)
		{
			for (T &it : items)
			{
				loadShape(ini, bulkName, it);
				it.smoothing = ini->getFloat(bulkName, "smoothing", it.smoothing.value);
			}

			for (const String &section : ini->sections())
			{
				String index = section;
				const String prefix = split(index, ".");
				if (prefix != itemName || index.empty())
					continue;
				if (!isDigitsOnly(index))
				{
					CAGE_LOG_THROW(Stringizer() + "section: '" + section + "'");
					CAGE_THROW_ERROR(Exception, "invalid primitive index");
				}
				const uint32 i = toUint32(index);
				if (i >= N)
				{
					CAGE_LOG(SeverityEnum::Warning, "scene", Stringizer() + "ignoring section '" + section + "', only " + (uint32)N + " " + bulkName + " are available");
					skipSection(ini, section);
					continue;
				}
				T &it = items[i];
				loadShape(ini, section, it);
				it.smoothing = ini->getFloat(section, "smoothing", it.smoothing.value);
				loadPlacement(ini, section, it);
				if constexpr (std::is_same_v<T, EdgePrimitive>)
					it.length = ini->getFloat(section, "length", it.length.value);
			}
		}
	}

	Frame defaultFrame()
	{
		Frame frame;
		frame.scene = defaultScene();
		return frame;
	}

	Frame frameFromIni(Ini *ini)
	{
		Frame frame = defaultFrame();

		frame.camera.position = getVec3(ini, "camera", "position", frame.camera.position);
		frame.camera.fov = ini->getFloat("camera", "fov", frame.camera.fov.value);

		frame.palette.background = getVec3(ini, "colors", "background", frame.palette.background);
		frame.palette.object = getVec3(ini, "colors", "object", frame.palette.object);

		Light &l = frame.light;
		l.position = getVec3(ini, "light", "position", l.position);
		l.ambientScale = ini->getFloat("light", "ambient", l.ambientScale.value);
		l.diffuseScale = ini->getFloat("light", "diffuse", l.diffuseScale.value);
		l.specularScale = ini->getFloat("light", "specular", l.specularScale.value);
		l.specularPower = ini->getFloat("light", "specularPower", l.specularPower.value);
		l.occlusionScale = ini->getFloat("light", "occlusionScale", l.occlusionScale.value);
		l.occlusionRange = ini->getFloat("light", "occlusionRange", l.occlusionRange.value);
		l.occlusionStep = ini->getFloat("light", "occlusionStep", l.occlusionStep.value);
		if (!(l.occlusionStep > 0))
			CAGE_THROW_ERROR(Exception, "occlusion step must be positive");

		Scene &s = frame.scene;
		s.jointEdgeSmoothing = ini->getFloat("blending", "jointEdge", s.jointEdgeSmoothing.value);
		s.groundSmoothing = ini->getFloat("blending", "ground", s.groundSmoothing.value);

		loadCollection(ini, s.joints, "joints", "joint");
		loadCollection(ini, s.edges, "edges", "edge");

		loadShape(ini, "ground", s.ground);
		s.ground.smoothing = ini->getFloat("ground", "smoothing", s.ground.smoothing.value);
		loadPlacement(ini, "ground", s.ground);

		ini->checkUnused();
		validateFrame(frame);
		return frame;
	}

	Frame loadFrame(const String &path)
	{
		CAGE_LOG(SeverityEnum::Info, "scene", Stringizer() + "loading scene: " + path);
		Holder<Ini> ini = newIni();
		ini->importFile(path);
		try
		{
			return frameFromIni(+ini);
		}
		catch (...)
		{
			CAGE_LOG_THROW(Stringizer() + "scene file: " + path);
			throw;
		}
	}
}
