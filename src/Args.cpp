/* src/Args.cpp */
#include "sokol_args.h" // 実装は各実行ファイル側で定義

#include "Args.hpp"
#include <cstdio>
#include <cstdlib>
#include <string>

namespace Spwm
{
namespace Args
{

static bool read_uint(const char* key, unsigned long max, unsigned long& out)
{
  if (!sargs_exists(key)) return true; // 省略時は既定値

  const char* s = sargs_value(key);
  char* end = nullptr;
  unsigned long v = strtoul(s, &end, 0);
  if (end == s || *end != '\0' || v > max)
  {
    fprintf(stderr, "Error: invalid value %s=%s\n", key, s);
    return false;
  }
  out = v;
  return true;
}

bool LoadConfig(Config& cfg)
{
  unsigned long clk   = cfg.clk_hz;
  unsigned long pre   = cfg.pwm_prescale;
  unsigned long sync  = (unsigned long)cfg.sync_stages;
  unsigned long psclk = cfg.pin_sclk;
  unsigned long psdi  = cfg.pin_sdi;
  unsigned long pncs  = cfg.pin_ncs;

  // システムクロック clk_hz=10000000
  bool ok = read_uint("clk_hz", 0xFFFFFFFFul, clk);
  // PWMプリスケーラ prescale=13
  ok = read_uint("prescale", 0xFFFF, pre) && ok;
  ok = read_uint("sync", 0xFF, sync) && ok;
  // ピン配置
  ok = read_uint("pin_sclk", 0xFF, psclk) && ok;
  ok = read_uint("pin_sdi",  0xFF, psdi)  && ok;
  ok = read_uint("pin_ncs",  0xFF, pncs)  && ok;
  if (!ok) return false;

  cfg.clk_hz       = (uint32_t)clk;
  cfg.pwm_prescale = (uint16_t)pre;
  cfg.sync_stages  = (int)sync;
  cfg.pin_sclk     = (uint8_t)psclk;
  cfg.pin_sdi      = (uint8_t)psdi;
  cfg.pin_ncs      = (uint8_t)pncs;

  // シミュレーション速度倍率 speed=1.0
  if (sargs_exists("speed"))
  {
    const char* s = sargs_value("speed");
    char* end = nullptr;
    double v = strtod(s, &end);
    if (end == s || *end != '\0')
    {
      fprintf(stderr, "Error: invalid value speed=%s\n", s);
      return false;
    }
    cfg.sim_speed = (float)v;
  }

  std::string why;
  if (!ValidateConfig(cfg, &why))
  {
    fprintf(stderr, "Error: %s\n", why.c_str());
    return false;
  }
  return true;
}

bool Flag(const char* key)
{
  return sargs_boolean(key);
}

} // namespace Args
} // namespace Spwm
