#ifndef frameConfig_h_r8c1xz4m
#define frameConfig_h_r8c1xz4m

#include "creature.h"

namespace cage
{
	class Ini;
}

namespace bonemarch
{
	Frame defaultFrame();
	Frame frameFromIni(Ini *ini); // consumes all items, throws on unused ones
	Frame loadFrame(const String &path);
}

#endif
