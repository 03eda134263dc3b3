/* src/Stimulus.hpp - SPIマスタ (テストベンチ側のビットバンギング送信)
 *
 * 1トランザクション:
 *   nCS Low (1クロック)
 *   16ビット MSB first: SCLK Low でデータ設定 → SCLK High (各 half_period クロック)
 *   nCS High, SCLK Low で tail_ticks クロック待機
 *
 * 既定の half_period = 51 は 10MHz で約5us (SCLK ≒ 98kHz)。
 */
#pragma once
#include <cstdint>
#include <deque>

namespace Spwm
{
  struct Config; // 前方宣言

  namespace Stimulus
  {
    static constexpr uint32_t DEFAULT_HALF_PERIOD = 51;
    static constexpr uint32_t DEFAULT_TAIL_TICKS  = 600;

    // 一定期間保持するライン状態 (正規化済み)
    struct Step
    {
      uint8_t  lines;
      uint32_t ticks;
    };

    struct State
    {
      std::deque<Step> queue;
      uint32_t used = 0; // 先頭ステップで消費したクロック数

      uint32_t half_period = DEFAULT_HALF_PERIOD;
      uint32_t tail_ticks  = DEFAULT_TAIL_TICKS;
    };

    // 完全な16ビットフレームを積む (アドレスが7bitを超えたら false)
    bool QueueTransaction(State& stim, bool write, uint8_t address, uint8_t data);

    // bits ビット送ったところで nCS を解放する不完全フレームを積む
    bool QueueAbort(State& stim, bool write, uint8_t address, uint8_t data, int bits);

    // バスをアイドルのまま保持
    void QueueIdle(State& stim, uint32_t ticks);

    // 今のクロックの ui_in を返して1クロック消費
    uint8_t Next(State& stim, const Config& cfg);

    bool     Busy(const State& stim);
    uint32_t PendingTicks(const State& stim);
    void     Clear(State& stim);

  } // namespace Stimulus
} // namespace Spwm
