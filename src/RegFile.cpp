/* src/RegFile.cpp - レジスタファイル & PWMジェネレータ実装 */
#include "RegFile.hpp"
#include "SpwmSystem.hpp"

//#define REG_DEBUG 1
#if REG_DEBUG
#include <cstdio>
#define REG_LOG(...) fprintf(stderr, "[REG] " __VA_ARGS__)
#else
#define REG_LOG(...)
#endif

namespace Spwm
{
namespace RegFile
{

void Reset(State& regs)
{
  regs = State();
}

bool IsWritableAddress(uint8_t addr)
{
  return addr < Reg::COUNT;
}

void Apply(State& regs, const SpiFrame::Commit& commit)
{
  // 読み出しコマンドは応答経路がないので何もしない
  if (!commit.write || !IsWritableAddress(commit.address))
  {
    regs.ignored++;
    REG_LOG("ignored %c addr=%02X data=%02X\n",
            commit.write ? 'W' : 'R', commit.address, commit.data);
    return;
  }

  switch (commit.address)
  {
    case Reg::OUT_A:    regs.out_a    = commit.data; break;
    case Reg::OUT_B:    regs.out_b    = commit.data; break;
    case Reg::PWM_EN_A: regs.pwm_en_a = commit.data; break;
    case Reg::PWM_EN_B: regs.pwm_en_b = commit.data; break;
    case Reg::DUTY:     regs.duty     = commit.data; break;
  }
  REG_LOG("%s <- %02X\n", RegName(commit.address), commit.data);
}

void Tick(State& regs, const Config& cfg)
{
  if (++regs.prescale_cnt >= cfg.pwm_prescale)
  {
    regs.prescale_cnt = 0;
    regs.counter++; // 8bit で自然に折り返す
  }
}

bool PwmLevel(const State& regs)
{
  if (regs.duty == DUTY_FULL) return true;
  return regs.counter < regs.duty;
}

// PWM_EN のビットだけ PWM 波形に差し替える
static uint8_t mux(uint8_t stat, uint8_t en, bool pwm)
{
  return (uint8_t)((stat & ~en) | (pwm ? en : 0));
}

uint8_t PortA(const State& regs)
{
  return mux(regs.out_a, regs.pwm_en_a, PwmLevel(regs));
}

uint8_t PortB(const State& regs)
{
  return mux(regs.out_b, regs.pwm_en_b, PwmLevel(regs));
}

uint8_t Peek(const State& regs, uint8_t addr)
{
  switch (addr)
  {
    case Reg::OUT_A:    return regs.out_a;
    case Reg::OUT_B:    return regs.out_b;
    case Reg::PWM_EN_A: return regs.pwm_en_a;
    case Reg::PWM_EN_B: return regs.pwm_en_b;
    case Reg::DUTY:     return regs.duty;
  }
  return 0;
}

const char* RegName(uint8_t addr)
{
  switch (addr)
  {
    case Reg::OUT_A:    return "OUT_A";
    case Reg::OUT_B:    return "OUT_B";
    case Reg::PWM_EN_A: return "PWM_EN_A";
    case Reg::PWM_EN_B: return "PWM_EN_B";
    case Reg::DUTY:     return "DUTY";
  }
  return "-";
}

} // namespace RegFile
} // namespace Spwm
