/* src/Probe.cpp */
#include "Probe.hpp"
#include <cmath>

namespace Spwm
{
namespace Probe
{

void Reset(State& probe)
{
  probe = State();
}

void Sample(State& probe, bool level, uint64_t tick)
{
  // 最初のサンプルは基準レベルの取得のみ
  if (probe.stage == Stage::PRIME)
  {
    probe.level = level;
    probe.stage = Stage::WAIT_RISE1;
    return;
  }

  bool rise = !probe.level && level;
  bool fall = probe.level && !level;
  probe.level = level;

  if (rise) probe.rises++;
  if (fall) probe.falls++;

  switch (probe.stage)
  {
    case Stage::WAIT_RISE1:
      if (rise) { probe.t_rise1 = tick; probe.stage = Stage::WAIT_FALL; }
      break;
    case Stage::WAIT_FALL:
      if (fall) { probe.t_fall = tick; probe.stage = Stage::WAIT_RISE2; }
      break;
    case Stage::WAIT_RISE2:
      if (rise) { probe.t_rise2 = tick; probe.stage = Stage::DONE; }
      break;
    default:
      break;
  }
}

bool Done(const State& probe)
{
  return probe.stage == Stage::DONE;
}

uint64_t PeriodTicks(const State& probe)
{
  if (!Done(probe)) return 0;
  return probe.t_rise2 - probe.t_rise1;
}

uint64_t HighTicks(const State& probe)
{
  if (!Done(probe)) return 0;
  return probe.t_fall - probe.t_rise1;
}

double FrequencyHz(const State& probe, uint32_t clk_hz)
{
  uint64_t period = PeriodTicks(probe);
  if (period == 0) return 0.0;
  return (double)clk_hz / (double)period;
}

double DutyPercent(const State& probe)
{
  uint64_t period = PeriodTicks(probe);
  if (period == 0) return 0.0;
  return 100.0 * (double)HighTicks(probe) / (double)period;
}

bool WithinTolerance(double measured, double expected, double tol)
{
  if (expected == 0.0) return measured == 0.0;
  return std::fabs(measured - expected) <= std::fabs(expected) * tol;
}

} // namespace Probe
} // namespace Spwm
