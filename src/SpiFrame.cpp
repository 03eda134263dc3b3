/* src/SpiFrame.cpp - SPIフレームデコーダ実装 */
#include "SpiFrame.hpp"
#include "SpwmSystem.hpp"

//#define SPI_DEBUG 1
#if SPI_DEBUG
#include <cstdio>
#define SPI_LOG(...) fprintf(stderr, "[SPI] " __VA_ARGS__)
#else
#define SPI_LOG(...)
#endif

namespace Spwm
{
namespace SpiFrame
{

void Reset(State& spi)
{
  for (int i = 0; i < MAX_SYNC_STAGES; i++) spi.sync[i] = Line::IDLE;
  spi.prev      = Line::IDLE;
  spi.phase     = Phase::IDLE;
  spi.shift     = 0;
  spi.bit_cnt   = 0;
  spi.committed = 0;
  spi.aborted   = 0;
  spi.overrun   = 0;
}

Commit Decode(uint16_t word)
{
  Commit c;
  c.write   = (word & 0x8000) != 0;
  c.address = (uint8_t)((word >> 8) & 0x7F);
  c.data    = (uint8_t)(word & 0xFF);
  return c;
}

const char* PhaseName(Phase phase)
{
  switch (phase)
  {
    case Phase::IDLE:      return "IDLE";
    case Phase::RECEIVING: return "RECEIVING";
    case Phase::COMPLETE:  return "COMPLETE";
    case Phase::OVERRUN:   return "OVERRUN";
  }
  return "?";
}

// ---------------------------------------------------------------
//  Tick - 1システムクロック分
// ---------------------------------------------------------------
bool Tick(State& spi, const Config& cfg, uint8_t ui_in, Commit& out)
{
  // 同期化FFをシフト
  int stages = cfg.sync_stages;
  if (stages < 1) stages = 1;
  if (stages > MAX_SYNC_STAGES) stages = MAX_SYNC_STAGES;
  for (int i = stages - 1; i > 0; i--) spi.sync[i] = spi.sync[i - 1];
  spi.sync[0] = UnpackLines(cfg, ui_in);

  const uint8_t cur  = spi.sync[stages - 1];
  const bool    ncs  = (cur & Line::NCS) != 0;
  const bool    rise = (cur & Line::SCLK) && !(spi.prev & Line::SCLK);
  spi.prev = cur;

  bool fired = false;

  if (ncs)
  {
    // nCS 解放: フレーム終端
    switch (spi.phase)
    {
      case Phase::COMPLETE:
        out = Decode(spi.shift);
        spi.committed++;
        fired = true;
        SPI_LOG("commit %c addr=%02X data=%02X\n",
                out.write ? 'W' : 'R', out.address, out.data);
        break;
      case Phase::RECEIVING:
        spi.aborted++;
        SPI_LOG("abort after %d bits\n", spi.bit_cnt);
        break;
      case Phase::OVERRUN:
        spi.overrun++;
        SPI_LOG("overrun (%d bits)\n", spi.bit_cnt);
        break;
      case Phase::IDLE:
        break;
    }
    spi.phase = Phase::IDLE;
    return fired;
  }

  // nCS アサート中
  if (spi.phase == Phase::IDLE)
  {
    spi.phase   = Phase::RECEIVING;
    spi.shift   = 0;
    spi.bit_cnt = 0;
  }

  if (!rise) return false;

  switch (spi.phase)
  {
    case Phase::RECEIVING:
      spi.shift = (uint16_t)((spi.shift << 1) | ((cur & Line::SDI) ? 1 : 0));
      if (++spi.bit_cnt == FRAME_BITS) spi.phase = Phase::COMPLETE;
      break;
    case Phase::COMPLETE:
      spi.bit_cnt++;
      spi.phase = Phase::OVERRUN;
      break;
    case Phase::OVERRUN:
      spi.bit_cnt++;
      break;
    case Phase::IDLE:
      break;
  }
  return false;
}

} // namespace SpiFrame
} // namespace Spwm
