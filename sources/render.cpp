#include "renderer.h"

#include <cage-core/image.h>
#include <cage-core/tasks.h>
#include <cage-core/timer.h>

namespace bonemarch
{
	namespace
	{
		struct FrameRenderer
		{
			const Frame &frame;
			Holder<Image> image;
			const uint32 width;
			const uint32 height;

			FrameRenderer(const Frame &frame, uint32 width, uint32 height) : frame(frame), width(width), height(height) {}

			void rowEntry(uint32 y)
			{
				for (uint32 x = 0; x < width; x++)
					image->set(x, y, renderPixel(frame, pixelToFragCoord(x, y, width, height)));
			}

			void render()
			{
				image = newImage();
				image->initialize(width, height, 4, ImageFormatEnum::Float);
				tasksRunBlocking("render rows", Delegate<void(uint32)>().bind<FrameRenderer, &FrameRenderer::rowEntry>(this), height);
			}
		};
	}

	Vec2 pixelToFragCoord(uint32 x, uint32 y, uint32 width, uint32 height)
	{
		CAGE_ASSERT(x < width && y < height);
		const Real h = Real(height);
		const Real u = (Real(x * 2 + 1) - Real(width)) / h;
		const Real v = (h - Real(y * 2 + 1)) / h;
		return Vec2(u, v);
	}

	Holder<Image> renderFrame(const Frame &frame, uint32 width, uint32 height)
	{
		if (width == 0 || height == 0)
			CAGE_THROW_ERROR(Exception, "invalid image resolution");
		validateFrame(frame);

		CAGE_LOG(SeverityEnum::Info, "renderer", Stringizer() + "rendering " + width + "x" + height);
		Holder<Timer> timer = newTimer();
		FrameRenderer renderer(frame, width, height);
		renderer.render();
		CAGE_LOG(SeverityEnum::Info, "renderer", Stringizer() + "frame rendered in " + (timer->duration() / 1000) + " ms");

		renderer.image->convert(ImageFormatEnum::U8);
		return std::move(renderer.image);
	}
}
