/* src/spwm_sim.cpp - ヘッドレス実行 (スクリプトテストベンチ)
 *
 *   spwm_sim [script=bench.txt] [trace=true] [clk_hz=..] [prescale=..] ...
 *
 * script 省略時は組み込みのリファレンスシナリオを実行する。
 */
#define SOKOL_ARGS_IMPL
#include "sokol_args.h"

#include "SpwmSystem.hpp"
#include "Args.hpp"
#include "Script.hpp"
#include <cstdio>

// 前方宣言
void PrintStatus(const Spwm::System& sys);

int main(int argc, char* argv[])
{
  // コマンドライン引数パース
  sargs_desc sargs_d = {};
  sargs_d.argc = argc;
  sargs_d.argv = argv;
  sargs_setup(&sargs_d);

  // システムを生成
  Spwm::System sys;
  if (!Spwm::Args::LoadConfig(sys.cfg))
  {
    sargs_shutdown();
    return 2;
  }
  Spwm::Init(sys);

  printf("[SIM] clk=%u Hz prescale=%u -> PWM %.1f Hz (%u ticks/period)\n",
         sys.cfg.clk_hz, sys.cfg.pwm_prescale, sys.cfg.pwm_hz(),
         sys.cfg.pwm_period_ticks());

  Spwm::Script::Options opt;
  opt.trace = Spwm::Args::Flag("trace");

  Spwm::Script::Result res;
  bool ok;
  if (sargs_exists("script"))
  {
    const char* path = sargs_value("script");
    printf("[SIM] script '%s'\n", path);
    ok = Spwm::Script::RunFile(sys, path, opt, &res);
  }
  else
  {
    printf("[SIM] built-in reference scenario\n");
    ok = Spwm::Script::RunText(sys, Spwm::Script::ReferenceScript(),
                               "reference", opt, &res);
  }

  PrintStatus(sys);
  printf("[SIM] %d commands, %d checks: %s\n",
         res.lines, res.checks, ok ? "PASS" : "FAIL");

  sargs_shutdown();
  return ok ? 0 : 1;
}

// 最終状態の表示
void PrintStatus(const Spwm::System& sys)
{
  using namespace Spwm;
  const RegFile::State& r = sys.regs;

  printf("[SIM] @%llu uo_out:%02X uio_out:%02X | OUT_A:%02X OUT_B:%02X EN_A:%02X EN_B:%02X DUTY:%02X CNT:%02X\n",
         (unsigned long long)sys.cycles, sys.uo_out, sys.uio_out,
         r.out_a, r.out_b, r.pwm_en_a, r.pwm_en_b, r.duty, r.counter);
  printf("[SIM] frames: committed=%u aborted=%u overrun=%u ignored=%u (decoder %s)\n",
         sys.spi.committed, sys.spi.aborted, sys.spi.overrun, r.ignored,
         SpiFrame::PhaseName(sys.spi.phase));
}
