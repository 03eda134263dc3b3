/* src/RegFile.hpp - レジスタファイル & PWMジェネレータ
 *
 * 出力ビットごとに PWM_EN が 1 なら PWM 波形、0 なら OUT の静的値を出す。
 * PWM は全ビット共通のカウンタと DUTY で動くので、有効ビットはすべて同相。
 *
 * カウンタ: 8bit (0..255) を pwm_prescale クロックごとに +1
 *   周期 = pwm_prescale * 256 クロック (10MHz / (13*256) ≒ 3005Hz)
 *   出力 = (DUTY == 255) || (counter < DUTY)
 */
#pragma once
#include <cstdint>

#include "SpiFrame.hpp"

namespace Spwm
{
  struct Config; // 前方宣言

  namespace RegFile
  {
    // レジスタアドレス
    namespace Reg
    {
      constexpr uint8_t OUT_A    = 0x00; // ポートA 静的出力
      constexpr uint8_t OUT_B    = 0x01; // ポートB 静的出力
      constexpr uint8_t PWM_EN_A = 0x02; // ポートA PWM有効マスク
      constexpr uint8_t PWM_EN_B = 0x03; // ポートB PWM有効マスク
      constexpr uint8_t DUTY     = 0x04; // 共通デューティ
      constexpr uint8_t COUNT    = 5;
    }

    static constexpr int     PWM_STEPS = 256;  // カウンタ1周のステップ数
    static constexpr uint8_t DUTY_FULL = 0xFF; // 常時High

    struct State
    {
      // レジスタ
      uint8_t out_a    = 0;
      uint8_t out_b    = 0;
      uint8_t pwm_en_a = 0;
      uint8_t pwm_en_b = 0;
      uint8_t duty     = 0;

      // PWM カウンタ
      uint16_t prescale_cnt = 0;
      uint8_t  counter      = 0;

      // 無視したコマンド数 (読み出し/未割り当てアドレス)
      uint32_t ignored = 0;
    };

    void Reset(State& regs);

    // 書き込み可能なアドレスか
    bool IsWritableAddress(uint8_t addr);

    // コミットを反映 (唯一の更新経路)
    void Apply(State& regs, const SpiFrame::Commit& commit);

    // PWMカウンタを1クロック進める
    void Tick(State& regs, const Config& cfg);

    // 現在のPWM波形レベル
    bool PwmLevel(const State& regs);

    // ポート出力
    uint8_t PortA(const State& regs);
    uint8_t PortB(const State& regs);

    // デバッグ表示用 (SPI からは読めない)
    uint8_t Peek(const State& regs, uint8_t addr);
    const char* RegName(uint8_t addr);

  } // namespace RegFile
} // namespace Spwm
