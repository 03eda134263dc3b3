/* src/Probe.hpp - 出力ビットの波形計測
 *
 * 立ち上がり → 立ち下がり → 立ち上がり の3エッジの時刻から
 * 周期・High時間・周波数・デューティ比を求める。
 */
#pragma once
#include <cstdint>

namespace Spwm
{
namespace Probe
{

  enum class Stage { PRIME, WAIT_RISE1, WAIT_FALL, WAIT_RISE2, DONE };

  struct State
  {
    Stage    stage = Stage::PRIME;
    bool     level = false; // 直前のレベル
    uint64_t t_rise1 = 0;
    uint64_t t_fall  = 0;
    uint64_t t_rise2 = 0;

    // 累計エッジ数 (計測完了後も数え続ける)
    uint32_t rises = 0;
    uint32_t falls = 0;
  };

  void Reset(State& probe);

  // 1クロックごとにレベルを与える
  void Sample(State& probe, bool level, uint64_t tick);

  bool     Done(const State& probe);
  uint64_t PeriodTicks(const State& probe);
  uint64_t HighTicks(const State& probe);
  double   FrequencyHz(const State& probe, uint32_t clk_hz);
  double   DutyPercent(const State& probe);

  // 許容差 (相対) 内か。期待値0は完全一致のみ
  bool WithinTolerance(double measured, double expected, double tol);

} // namespace Probe
} // namespace Spwm
