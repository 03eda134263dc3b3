/* src/Script.cpp - テキストスクリプトによるテストベンチ実装 */
#include "Script.hpp"
#include "Stimulus.hpp"
#include "Probe.hpp"

#include <cstdio>
#include <cstdlib>
#include <vector>

namespace Spwm
{
namespace Script
{

// ---------------------------------------------------------------
//  リファレンスシナリオ
//  書き込み/無効アドレス/読み出しの確認後、ポートAのPWMを計測する
// ---------------------------------------------------------------
static const char* kReference = R"(
# 静的出力と無効コマンド
reset 5
wait 5
write 0x00 0xF0
expect A 0xF0
wait 1000
write 0x01 0xCC
expect B 0xCC
wait 100
write 0x30 0xAA
expect A 0xF0
wait 100
read 0x30 0xBE
expect A 0xF0
wait 100
read 0x41 0xEF
expect B 0xCC
wait 100

# ポートA 全ビットPWM
write 0x02 0xFF
wait 100
write 0x04 0xCF
measure A 0 3000 81.18
wait 30000
write 0x04 0xFF
measure A 0 0 100
wait 30000
write 0x04 0x00
measure A 0 0 0
wait 30000
write 0x04 0x01
measure A 0 3000 0.392
wait 30000

# 周波数 (50%)
reset 5
wait 5
write 0x02 0xFF
write 0x04 0x80
wait 5
measure A 0 3000 50.2
)";

const char* ReferenceScript() { return kReference; }

// ---------------------------------------------------------------
//  実行コンテキスト
// ---------------------------------------------------------------
struct Context
{
  System&          sys;
  const Options&   opt;
  Result&          res;
  std::string      name;
  int              line = 0;
  Stimulus::State  stim;
};

static bool error(const Context& ctx, const char* msg, const char* arg = "")
{
  fprintf(stderr, "Error: %s:%d: %s%s\n", ctx.name.c_str(), ctx.line, msg, arg);
  return false;
}

// 1クロック進める (スティミュラス→ui_in)
static void step(Context& ctx)
{
  System& sys = ctx.sys;
  uint32_t before = sys.spi.committed;
  sys.ui_in = Stimulus::Next(ctx.stim, sys.cfg);
  Tick(sys);

  if (ctx.opt.trace && sys.spi.committed != before)
  {
    const SpiFrame::Commit& c = sys.last_commit;
    printf("[SCRIPT] @%llu commit %c addr=0x%02X data=0x%02X%s\n",
           (unsigned long long)sys.cycles, c.write ? 'W' : 'R',
           c.address, c.data,
           (c.write && RegFile::IsWritableAddress(c.address)) ? "" : " (ignored)");
  }
}

static void run_stimulus(Context& ctx)
{
  while (Stimulus::Busy(ctx.stim)) step(ctx);
}

static void run_idle(Context& ctx, uint32_t ticks)
{
  for (uint32_t i = 0; i < ticks; i++) step(ctx);
}

// 数値パース (10進 / 0x16進)
static bool parse_uint(const std::string& tok, unsigned long max, unsigned long& out)
{
  if (tok.empty()) return false;
  const char* s = tok.c_str();
  int base = 10;
  if (tok.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X'))
  {
    s += 2;
    base = 16;
  }
  char* end = nullptr;
  unsigned long v = strtoul(s, &end, base);
  if (end == s || *end != '\0' || v > max) return false;
  out = v;
  return true;
}

static bool parse_double(const std::string& tok, double& out)
{
  const char* s = tok.c_str();
  char* end = nullptr;
  double v = strtod(s, &end);
  if (end == s || *end != '\0') return false;
  out = v;
  return true;
}

static bool parse_port(const std::string& tok, bool& port_b)
{
  if (tok == "A" || tok == "a") { port_b = false; return true; }
  if (tok == "B" || tok == "b") { port_b = true;  return true; }
  return false;
}

static std::vector<std::string> split(const char* line)
{
  std::vector<std::string> toks;
  std::string cur;
  for (const char* p = line; *p; p++)
  {
    if (*p == '#') break;
    if (*p == ' ' || *p == '\t' || *p == '\r' || *p == '\n')
    {
      if (!cur.empty()) { toks.push_back(cur); cur.clear(); }
    }
    else cur += *p;
  }
  if (!cur.empty()) toks.push_back(cur);
  return toks;
}

// ---------------------------------------------------------------
//  measure - 1周期計測
// ---------------------------------------------------------------
static bool do_measure(Context& ctx, bool port_b, int bit, double exp_hz, double exp_duty)
{
  System& sys = ctx.sys;
  Probe::State probe;
  const uint8_t mask = (uint8_t)(1u << bit);

  // 4周期待っても終わらなければ定常レベルとみなす
  const uint64_t timeout = (uint64_t)sys.cfg.pwm_period_ticks() * 4;
  for (uint64_t i = 0; i < timeout && !Probe::Done(probe); i++)
  {
    step(ctx);
    uint8_t port = port_b ? sys.uio_out : sys.uo_out;
    Probe::Sample(probe, (port & mask) != 0, sys.cycles);
  }

  double hz, duty;
  if (Probe::Done(probe))
  {
    hz   = Probe::FrequencyHz(probe, sys.cfg.clk_hz);
    duty = Probe::DutyPercent(probe);
  }
  else if (probe.rises == 0 && probe.falls == 0)
  {
    hz   = 0.0;
    duty = probe.level ? 100.0 : 0.0;
  }
  else
  {
    return error(ctx, "incomplete waveform");
  }

  ctx.res.checks++;
  bool ok = Probe::WithinTolerance(hz, exp_hz, ctx.opt.tolerance) &&
            Probe::WithinTolerance(duty, exp_duty, ctx.opt.tolerance);
  printf("[SCRIPT] %s%d: %.1f Hz, %.2f %% (expected %.1f Hz, %.2f %%) %s\n",
         port_b ? "B" : "A", bit, hz, duty, exp_hz, exp_duty, ok ? "OK" : "NG");
  if (!ok) error(ctx, "measure out of tolerance");
  return ok;
}

// ---------------------------------------------------------------
//  1行実行
// ---------------------------------------------------------------
static bool exec_line(Context& ctx, const std::vector<std::string>& t)
{
  System& sys = ctx.sys;
  const std::string& cmd = t[0];
  unsigned long a = 0, b = 0, c = 0;

  if (cmd == "reset")
  {
    // rst_n は同期リセットなので最低1クロック必要
    if (t.size() != 2 || !parse_uint(t[1], 0xFFFFFFFFul, a) || a == 0)
      return error(ctx, "usage: reset <ticks 1..>");
    Stimulus::Clear(ctx.stim);
    sys.rst_n = false;
    run_idle(ctx, (uint32_t)a);
    sys.rst_n = true;
    return true;
  }

  if (cmd == "write" || cmd == "read")
  {
    if (t.size() != 3 || !parse_uint(t[1], 0x7F, a) || !parse_uint(t[2], 0xFF, b))
      return error(ctx, "usage: ", (cmd + " <addr 0..0x7F> <data 0..0xFF>").c_str());
    if (!Stimulus::QueueTransaction(ctx.stim, cmd == "write", (uint8_t)a, (uint8_t)b))
      return error(ctx, "bad transaction");
    run_stimulus(ctx);
    return true;
  }

  if (cmd == "abort")
  {
    if (t.size() != 4 || !parse_uint(t[1], 0x7F, a) || !parse_uint(t[2], 0xFF, b) ||
        !parse_uint(t[3], SpiFrame::FRAME_BITS - 1, c))
      return error(ctx, "usage: abort <addr> <data> <bits 0..15>");
    if (!Stimulus::QueueAbort(ctx.stim, true, (uint8_t)a, (uint8_t)b, (int)c))
      return error(ctx, "bad transaction");
    run_stimulus(ctx);
    return true;
  }

  if (cmd == "wait")
  {
    if (t.size() != 2 || !parse_uint(t[1], 0xFFFFFFFFul, a))
      return error(ctx, "usage: wait <ticks>");
    run_idle(ctx, (uint32_t)a);
    return true;
  }

  if (cmd == "enable")
  {
    if (t.size() != 2 || !parse_uint(t[1], 1, a))
      return error(ctx, "usage: enable <0|1>");
    sys.ena = (a != 0);
    return true;
  }

  if (cmd == "expect")
  {
    bool port_b = false;
    if (t.size() != 3 || !parse_port(t[1], port_b) || !parse_uint(t[2], 0xFF, a))
      return error(ctx, "usage: expect <A|B> <value>");
    ctx.res.checks++;
    uint8_t got = port_b ? sys.uio_out : sys.uo_out;
    if (got != (uint8_t)a)
    {
      fprintf(stderr, "Error: %s:%d: port %s expected 0x%02lX, got 0x%02X\n",
              ctx.name.c_str(), ctx.line, port_b ? "B" : "A", a, got);
      return false;
    }
    return true;
  }

  if (cmd == "measure")
  {
    bool port_b = false;
    double hz = 0, duty = 0;
    if (t.size() != 5 || !parse_port(t[1], port_b) || !parse_uint(t[2], 7, a) ||
        !parse_double(t[3], hz) || !parse_double(t[4], duty))
      return error(ctx, "usage: measure <A|B> <bit> <hz> <duty%>");
    return do_measure(ctx, port_b, (int)a, hz, duty);
  }

  return error(ctx, "unknown command: ", cmd.c_str());
}

// ---------------------------------------------------------------
//  RunText / RunFile
// ---------------------------------------------------------------
bool RunText(System& sys, const std::string& text, const std::string& name,
             const Options& opt, Result* res)
{
  Result local;
  Result& r = res ? *res : local;
  r = Result();

  Context ctx{sys, opt, r, name};

  size_t pos = 0;
  while (pos <= text.size())
  {
    size_t nl = text.find('\n', pos);
    if (nl == std::string::npos) nl = text.size();
    std::string line = text.substr(pos, nl - pos);
    pos = nl + 1;
    ctx.line++;

    std::vector<std::string> toks = split(line.c_str());
    if (toks.empty()) continue;

    r.lines++;
    if (!exec_line(ctx, toks))
    {
      r.failed++;
      return false;
    }
  }
  return true;
}

bool RunFile(System& sys, const std::string& path, const Options& opt, Result* res)
{
  FILE* fp = fopen(path.c_str(), "rb");
  if (!fp)
  {
    fprintf(stderr, "Error: cannot open script '%s'\n", path.c_str());
    return false;
  }

  std::string text;
  char buf[4096];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), fp)) > 0) text.append(buf, n);
  bool read_ok = !ferror(fp);
  fclose(fp);
  if (!read_ok)
  {
    fprintf(stderr, "Error: read failed '%s'\n", path.c_str());
    return false;
  }

  return RunText(sys, text, path, opt, res);
}

} // namespace Script
} // namespace Spwm
