#include "action_adapter.hpp"
#include "pmacro_program.hpp"
#include "pmacro_vm.hpp"
#include <cassert>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace PMACRO;

using Actions = std::vector<std::string>;

// Runs `source` against `sim`, capturing both log streams
struct Harness {
  Program program;
  std::ostringstream out;
  std::ostringstream err;
  Interpreter vm;

  Harness(const std::string &source, SimulatedAdapter &sim)
      : program(parseProgram(source)), vm(program, sim, out, err) {}
};

static Image noiseImage(int w, int h, uint32_t seed) {
  Image img;
  img.w = w;
  img.h = h;
  img.channels = 4;
  img.pixels.resize((size_t)w * h * 4);
  uint32_t s = seed;
  for (size_t i = 0; i < img.pixels.size(); ++i) {
    s = s * 1664525u + 1013904223u;
    img.pixels[i] = (i % 4 == 3) ? 255 : (uint8_t)(s >> 24);
  }
  return img;
}

static Image crop(const Image &src, int x, int y, int w, int h) {
  Image out;
  out.w = w;
  out.h = h;
  out.channels = src.channels;
  for (int j = 0; j < h; ++j)
    for (int i = 0; i < w; ++i)
      for (int c = 0; c < src.channels; ++c)
        out.pixels.push_back(
            src.pixels[((size_t)(y + j) * src.w + (x + i)) * src.channels + c]);
  return out;
}

static bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

int main() {
  std::cout << "Running interpreter tests...\n";

  // === Test 1: Scenario A - true condition runs the block ===
  {
    SimulatedAdapter sim;
    Harness h("var set $n 5\n"
              "if ($n > 3)\n"
              "key press a\n"
              "end\n",
              sim);
    assert(h.vm.run() == RunResult::Completed);
    assert(sim.actions() == (Actions{"key press a"}));
    std::cout << "Test 1 passed: one key press for a.\n";
  }

  // === Test 2: Scenario B - counted loop through goto ===
  {
    SimulatedAdapter sim;
    Harness h("checkpoint \"L\"\n"
              "var increase $n 1\n"
              "if ($n < 3)\n"
              "goto \"L\"\n"
              "end\n",
              sim);
    assert(h.vm.run() == RunResult::Completed);
    assert(h.vm.variables().getInteger("n") == 3);
    std::cout << "Test 2 passed: loop stopped at n=3.\n";
  }

  // === Test 3: goto resumes after the checkpoint line ===
  {
    SimulatedAdapter sim;
    Harness h("checkpoint \"A\"\n"
              "key press x\n"
              "goto \"A\"\n",
              sim);
    h.vm.step(); // checkpoint
    h.vm.step(); // key press x
    assert(h.vm.pc() == 2);
    h.vm.step(); // goto
    assert(h.vm.pc() == 1);
    h.vm.step();
    assert(sim.actions() == (Actions{"key press x", "key press x"}));
    std::cout << "Test 3 passed: goto lands on slot checkpoint+1.\n";
  }

  // === Test 4: goto to an unknown checkpoint aborts ===
  {
    SimulatedAdapter sim;
    Harness h("# start\n"
              "goto \"nowhere\"\n"
              "key press a\n",
              sim);
    assert(h.vm.run() == RunResult::Aborted);
    assert(sim.actions().empty());
    assert(h.vm.executedCount() == 0);
    assert(contains(h.err.str(), "Checkpoint 'nowhere' not found"));
    assert(contains(h.err.str(), "at line 2"));
    std::cout << "Test 4 passed: missing checkpoint is fatal.\n";
  }

  // === Test 5: false condition skips the block, true runs it ===
  {
    const std::string body = "if ($n > 3)\n"
                             "key press a\n"
                             "mouse left click\n"
                             "end\n"
                             "key press b\n";
    SimulatedAdapter skip;
    Harness hs("var set $n 1\n" + body, skip);
    assert(hs.vm.run() == RunResult::Completed);
    assert(skip.actions() == (Actions{"key press b"}));

    SimulatedAdapter run;
    Harness hr("var set $n 4\n" + body, run);
    assert(hr.vm.run() == RunResult::Completed);
    assert(run.actions() ==
           (Actions{"key press a", "mouse left click", "key press b"}));
    std::cout << "Test 5 passed: if/end blocks.\n";
  }

  // === Test 6: skipping stops at the first end, nesting ignored ===
  {
    SimulatedAdapter sim;
    Harness h("if (0)\n"
              "key press a\n"
              "if (1)\n"
              "key press b\n"
              "end\n"
              "key press c\n"
              "end\n"
              "key press d\n",
              sim);
    assert(h.vm.run() == RunResult::Completed);
    assert(sim.actions() == (Actions{"key press c", "key press d"}));
    std::cout << "Test 6 passed: flat skip to first end.\n";
  }

  // === Test 7: false condition without end runs off the program ===
  {
    SimulatedAdapter sim;
    Harness h("if (1 > 2)\n"
              "key press a\n",
              sim);
    assert(h.vm.run() == RunResult::Completed);
    assert(sim.actions().empty());
    assert(h.vm.pc() == h.program.size());
    std::cout << "Test 7 passed: unterminated skip ends the run.\n";
  }

  // === Test 8: unknown commands are not fatal ===
  {
    SimulatedAdapter sim;
    Harness h("frobnicate the widget\n"
              "sleep 0\n",
              sim);
    assert(h.vm.run() == RunResult::Completed);
    assert(h.vm.executedCount() == 2);
    assert(contains(h.err.str(), "Unknown command: frobnicate the widget"));
    assert(contains(h.out.str(), "Slept for 0ms"));
    std::cout << "Test 8 passed: unknown command skipped.\n";
  }

  // === Test 9: Scenario C - mouse move to an unset variable ===
  {
    SimulatedAdapter sim;
    Harness h("mouse move $pos\n", sim);
    assert(h.vm.run() == RunResult::Aborted);
    assert(sim.actions().empty());
    assert(contains(h.vm.lastError(), "$pos"));
    std::cout << "Test 9 passed: unset position aborts before actuation.\n";
  }

  // === Test 10: mouse move to an integer variable is a type error ===
  {
    SimulatedAdapter sim;
    Harness h("var set $pos 7\n"
              "mouse move $pos\n",
              sim);
    assert(h.vm.run() == RunResult::Aborted);
    assert(sim.actions().empty());
    std::cout << "Test 10 passed: mistyped variable aborts.\n";
  }

  // === Test 11: positions, literals and actuation ===
  {
    SimulatedAdapter sim;
    Harness h("var set $p (15, -4)\n"
              "mouse move $p\n"
              "mouse move 100, 200\n"
              "mouse right down\n"
              "mouse right up\n"
              "key down shift\n"
              "key up shift\n"
              "key type \"hello world\"\n"
              "key type \"\"\n",
              sim);
    assert(h.vm.run() == RunResult::Completed);
    Actions expected = {"mouse move 15,-4", "mouse move 100,200",
                        "mouse right down", "mouse right up",
                        "key down shift",   "key up shift",
                        "key type hello world", "key type "};
    assert(sim.actions() == expected);
    assert(h.vm.variables().getPosition("p") == (Position{15, -4}));
    std::cout << "Test 11 passed: actuation dispatched.\n";
  }

  // === Test 12: template found, position rescaled, status 0 ===
  {
    SimulatedAdapter sim(ScreenSize{100, 100});
    Image screen = noiseImage(200, 200, 99);
    sim.setScreen(screen);
    // 12x10 template whose center sits at (80, 60) in capture pixels
    sim.addImage("button.png", crop(screen, 74, 55, 12, 10));

    Harness h("cv match button.png 90% $btn\n"
              "if ($ == 0)\n"
              "mouse move $btn\n"
              "end\n",
              sim);
    assert(h.vm.run() == RunResult::Completed);
    assert(h.vm.lastStatus() == STATUS_SUCCESS);
    assert(h.vm.variables().getPosition("btn") == (Position{40, 30}));
    assert(sim.actions() == (Actions{"mouse move 40,30"}));
    std::cout << "Test 12 passed: match stored as (40, 30).\n";
  }

  // === Test 13: no match sets status 1 and keeps the variable ===
  {
    SimulatedAdapter sim(ScreenSize{200, 200});
    sim.setScreen(noiseImage(200, 200, 99));
    sim.addImage("other.png", noiseImage(12, 10, 4242));

    Harness h("var set $btn (1, 1)\n"
              "cv match \"other.png\" 95% $btn\n"
              "if ($ == 1)\n"
              "key press f\n"
              "end\n",
              sim);
    assert(h.vm.run() == RunResult::Completed);
    assert(h.vm.lastStatus() == STATUS_FAILURE);
    assert(h.vm.variables().getPosition("btn") == (Position{1, 1}));
    assert(sim.actions() == (Actions{"key press f"}));
    std::cout << "Test 13 passed: failed match reported via status.\n";
  }

  // === Test 14: missing template or failed capture never abort ===
  {
    SimulatedAdapter sim;
    Harness h("cv match missing.png 80% $x\n"
              "key press a\n",
              sim);
    assert(h.vm.run() == RunResult::Completed);
    assert(h.vm.lastStatus() == STATUS_FAILURE);
    assert(h.vm.variables().find("x") == nullptr);
    assert(contains(h.err.str(), "missing.png"));
    assert(sim.actions() == (Actions{"key press a"}));

    SimulatedAdapter broken;
    broken.setCaptureFails(true);
    broken.addImage("t.png", noiseImage(4, 4, 1));
    Harness hb("cv match t.png 80% $x\n", broken);
    assert(hb.vm.run() == RunResult::Completed);
    assert(hb.vm.lastStatus() == STATUS_FAILURE);
    assert(broken.captureCount() == 1);
    std::cout << "Test 14 passed: template errors are non-fatal.\n";
  }

  // === Test 15: malformed recognised commands are fatal ===
  {
    const std::vector<std::string> bad = {
        "var set $x abc",          "var set x 5",
        "var set $x (1, 2",        "var increase $x",
        "goto missing_quotes",     "mouse middle click",
        "mouse move 10",           "mouse left hold",
        "key press",               "key press a b",
        "key tap a",               "key type hello",
        "sleep -5",                "sleep soon",
        "if $x > 1",               "end now",
        "cv match a.png 150% $x",  "cv match a.png 50 $x",
        "cv match 50% $x"};
    for (const std::string &line : bad) {
      SimulatedAdapter sim;
      Harness h(line + "\nkey press z\n", sim);
      RunResult r = h.vm.run();
      if (r != RunResult::Aborted)
        std::cerr << "expected abort for: " << line << "\n";
      assert(r == RunResult::Aborted);
      assert(sim.actions().empty());
    }
    std::cout << "Test 15 passed: " << bad.size() << " malformed lines rejected.\n";
  }

  // === Test 16: increasing a position aborts ===
  {
    SimulatedAdapter sim;
    Harness h("var set $p (1, 2)\n"
              "var increase $p 1\n",
              sim);
    assert(h.vm.run() == RunResult::Aborted);
    assert(h.vm.variables().getPosition("p") == (Position{1, 2}));
    std::cout << "Test 16 passed: increase on a position is a type error.\n";
  }

  // === Test 17: broken condition is false and the run continues ===
  {
    SimulatedAdapter sim;
    Harness h("if ($n >)\n"
              "key press a\n"
              "end\n"
              "key press b\n",
              sim);
    assert(h.vm.run() == RunResult::Completed);
    assert(sim.actions() == (Actions{"key press b"}));
    assert(contains(h.err.str(), "Error evaluating condition"));
    std::cout << "Test 17 passed: condition errors treated as false.\n";
  }

  // === Test 18: opcode decoding ===
  {
    auto op = [](const std::string &text) {
      Instruction ins;
      ins.text = text;
      return Interpreter::decode(ins);
    };
    assert(op("var set $a 1") == Opcode::VarSet);
    assert(op("var increase $a 1") == Opcode::VarIncrease);
    assert(op("var frob $a") == Opcode::Unknown);
    assert(op("checkpoint \"x\"") == Opcode::Checkpoint);
    assert(op("if(1)") == Opcode::If);
    assert(op("iffy") == Opcode::Unknown);
    assert(op("cv match a.png 10% $x") == Opcode::CvMatch);
    assert(op("cv grab") == Opcode::Unknown);
    assert(op("end") == Opcode::End);
    std::cout << "Test 18 passed: opcodes decoded by leading words.\n";
  }

  // === Test 19: a pending interrupt stops the run ===
  {
    SimulatedAdapter sim;
    Harness h("key press a\n", sim);
    INTERRUPT_FLAG = 1;
    RunResult r = h.vm.run();
    INTERRUPT_FLAG = 0;
    assert(r == RunResult::Interrupted);
    assert(sim.actions().empty());
    std::cout << "Test 19 passed: interrupt honoured.\n";
  }

  // === Test 20: status starts at success ===
  {
    SimulatedAdapter sim;
    Harness h("if ($ == 0)\n"
              "key press s\n"
              "end\n",
              sim);
    assert(h.vm.run() == RunResult::Completed);
    assert(sim.actions() == (Actions{"key press s"}));
    std::cout << "Test 20 passed: initial status is 0.\n";
  }

  // === Test 21: var increase past the 64-bit range aborts with the line ===
  {
    SimulatedAdapter sim;
    Harness h("# counter\n"
              "var set $x 9223372036854775807\n"
              "var increase $x 1\n"
              "key press a\n",
              sim);
    assert(h.vm.run() == RunResult::Aborted);
    assert(h.vm.variables().getInteger("x") == 9223372036854775807LL);
    assert(sim.actions().empty());
    assert(contains(h.err.str(), "Error executing command 'var increase $x 1' at line 3"));
    std::cout << "Test 21 passed: overflowing increase is fatal.\n";
  }

  std::cout << "All interpreter tests passed.\n";
  return 0;
}
