/* src/Stimulus.cpp - SPIマスタ実装 */
#include "Stimulus.hpp"
#include "SpwmSystem.hpp"
#include <cstdio>

namespace Spwm
{
namespace Stimulus
{

// ---------------------------------------------------------------
//  内部ユーティリティ
// ---------------------------------------------------------------
static void push(State& stim, uint8_t lines, uint32_t ticks)
{
  if (ticks == 0) return;
  stim.queue.push_back({lines, ticks});
}

// フレームの先頭 bits ビットを送って nCS を解放する
static void queue_bits(State& stim, uint16_t word, int bits)
{
  // nCS Low, SCLK Low
  push(stim, 0, 1);

  for (int i = 0; i < bits; i++)
  {
    uint8_t sdi = ((word >> (15 - i)) & 1) ? Line::SDI : 0;
    push(stim, sdi, stim.half_period);              // SCLK Low, データ設定
    push(stim, sdi | Line::SCLK, stim.half_period); // SCLK High, データ保持
  }

  // nCS High
  push(stim, Line::IDLE, stim.tail_ticks);
}

static bool make_word(bool write, uint8_t address, uint8_t data, uint16_t& word)
{
  if (address > 0x7F)
  {
    fprintf(stderr, "[STIM] address 0x%02X is not 7-bit\n", address);
    return false;
  }
  word = (uint16_t)(((write ? 1 : 0) << 15) | (address << 8) | data);
  return true;
}

// ---------------------------------------------------------------
//  キュー操作
// ---------------------------------------------------------------
bool QueueTransaction(State& stim, bool write, uint8_t address, uint8_t data)
{
  uint16_t word;
  if (!make_word(write, address, data, word)) return false;
  queue_bits(stim, word, SpiFrame::FRAME_BITS);
  return true;
}

bool QueueAbort(State& stim, bool write, uint8_t address, uint8_t data, int bits)
{
  if (bits < 0 || bits >= SpiFrame::FRAME_BITS)
  {
    fprintf(stderr, "[STIM] abort length %d must be 0..15\n", bits);
    return false;
  }
  uint16_t word;
  if (!make_word(write, address, data, word)) return false;
  queue_bits(stim, word, bits);
  return true;
}

void QueueIdle(State& stim, uint32_t ticks)
{
  push(stim, Line::IDLE, ticks);
}

uint8_t Next(State& stim, const Config& cfg)
{
  if (stim.queue.empty()) return PackLines(cfg, Line::IDLE);

  const Step& s = stim.queue.front();
  uint8_t lines = s.lines;
  if (++stim.used >= s.ticks)
  {
    stim.queue.pop_front();
    stim.used = 0;
  }
  return PackLines(cfg, lines);
}

bool Busy(const State& stim)
{
  return !stim.queue.empty();
}

uint32_t PendingTicks(const State& stim)
{
  uint32_t total = 0;
  for (const Step& s : stim.queue) total += s.ticks;
  return total - stim.used;
}

void Clear(State& stim)
{
  stim.queue.clear();
  stim.used = 0;
}

} // namespace Stimulus
} // namespace Spwm
