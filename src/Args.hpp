/* src/Args.hpp - コマンドライン引数 (sokol_args) → Config
 *
 *   clk_hz=10000000  prescale=13  sync=2
 *   pin_sclk=0  pin_sdi=1  pin_ncs=2  speed=1.0
 */
#pragma once

#include "SpwmSystem.hpp"

namespace Spwm
{
namespace Args
{

  // sargs_setup 済みであること
  // 不正な値があればメッセージを出して false
  bool LoadConfig(Config& cfg);

  // 真偽値オプション (key=true / yes / on)
  bool Flag(const char* key);

} // namespace Args
} // namespace Spwm
