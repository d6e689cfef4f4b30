#include "frameConfig.h"
#include "renderer.h"

#include <cage-core/config.h>
#include <cage-core/image.h>
#include <cage-core/ini.h>
#include <cage-core/logger.h>
#include <cage-core/string.h>

namespace bonemarch
{
	namespace
	{
		ConfigString configScenePath("bonemarch/scene/path", "");
		ConfigUint32 configWidth("bonemarch/render/width", 1280);
		ConfigUint32 configHeight("bonemarch/render/height", 720);
		ConfigString configOutputPath("bonemarch/render/output", "render.png");

		void applyConfiguration(const Holder<Ini> &cmd)
		{
			configScenePath = cmd->cmdString('s', "scene", configScenePath);
			CAGE_LOG(SeverityEnum::Info, "configuration", Stringizer() + "scene: '" + (String)configScenePath + "'");

			configWidth = cmd->cmdUint32('w', "width", configWidth);
			configHeight = cmd->cmdUint32('h', "height", configHeight);
			CAGE_LOG(SeverityEnum::Info, "configuration", Stringizer() + "resolution: " + (uint32)configWidth + "x" + (uint32)configHeight);

			configOutputPath = cmd->cmdString('o', "output", configOutputPath);
			CAGE_LOG(SeverityEnum::Info, "configuration", Stringizer() + "output: '" + (String)configOutputPath + "'");
		}

		void renderEntry()
		{
			const String scenePath = configScenePath;
			if (scenePath.empty())
				CAGE_LOG(SeverityEnum::Info, "scene", "no scene given, using defaults");
			const Frame frame = scenePath.empty() ? defaultFrame() : loadFrame(scenePath);
			Holder<Image> img = renderFrame(frame, configWidth, configHeight);
			img->exportFile(configOutputPath);
			CAGE_LOG(SeverityEnum::Info, "renderer", Stringizer() + "saved: " + (String)configOutputPath);
		}
	}
}

int main(int argc, const char *args[])
{
	using namespace bonemarch;

	try
	{
		Holder<Logger> log1 = newLogger();
		log1->format.bind<logFormatConsole>();
		log1->output.bind<logOutputStdOut>();

		{
			Holder<Ini> cmd = newIni();
			cmd->parseCmd(argc, args);
			applyConfiguration(cmd);
			cmd->checkUnusedWithHelp();
		}

		renderEntry();
		return 0;
	}
	catch (...)
	{
		detail::logCurrentCaughtException();
	}
	return 1;
}
