/* src/sokol_impl.cpp - Sokol 実装定義 (GLCORE backend, CMake で SOKOL_GLCORE を定義) */

#define SOKOL_IMPL
#include "sokol_log.h"
#include "sokol_app.h"
#include "sokol_gfx.h"
#include "sokol_glue.h"
#include "sokol_args.h"
#include "sokol_audio.h"

// sokol_imgui 実装 (imgui.h は sokol_gfx.h / sokol_app.h の後に必須)
#include "imgui.h"
#define SOKOL_IMGUI_IMPL
#include "sokol_imgui.h"
