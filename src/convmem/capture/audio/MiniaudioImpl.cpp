// miniaudio 的实现只在此编译单元展开一次
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>
