#include "image.hpp"
#include "template_locator.hpp"
#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>

using namespace PMACRO;

// Deterministic RGBA noise
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

static Image solid(int w, int h, uint8_t v) {
  Image img;
  img.w = w;
  img.h = h;
  img.channels = 1;
  img.pixels.assign((size_t)w * h, v);
  return img;
}

void test_exact_match() {
  std::cout << "Running test_exact_match..." << std::endl;
  Image screen = noiseImage(60, 40, 7);
  Image templ = crop(screen, 20, 10, 12, 8);

  MatchResult m = locate(screen, templ, 0.9);
  assert(m.searched);
  assert(m.found);
  assert(m.offset == (Position{20, 10}));
  assert(m.center == (Position{26, 14}));
  assert(m.confidence > 0.999);
  std::cout << "test_exact_match PASSED" << std::endl;
}

void test_below_threshold() {
  std::cout << "Running test_below_threshold..." << std::endl;
  Image screen = noiseImage(60, 40, 7);
  Image other = noiseImage(12, 8, 12345);

  MatchResult m = locate(screen, other, 0.95);
  assert(m.searched);
  assert(!m.found);
  assert(m.confidence < 0.95);
  std::cout << "test_below_threshold PASSED (best " << m.confidence << ")"
            << std::endl;
}

void test_threshold_is_inclusive() {
  std::cout << "Running test_threshold_is_inclusive..." << std::endl;
  Image screen = solid(10, 10, 50);
  Image templ = solid(3, 3, 50);
  MatchResult m = locate(screen, templ, 1.0);
  assert(m.found);
  assert(m.confidence == 1.0);
  assert(m.center == (Position{1, 1}));
  std::cout << "test_threshold_is_inclusive PASSED" << std::endl;
}

void test_flat_mismatch() {
  std::cout << "Running test_flat_mismatch..." << std::endl;
  MatchResult m = locate(solid(10, 10, 50), solid(3, 3, 200), 0.5);
  assert(!m.found);
  assert(m.confidence == 0.0);
  std::cout << "test_flat_mismatch PASSED" << std::endl;
}

void test_template_too_large() {
  std::cout << "Running test_template_too_large..." << std::endl;
  MatchResult m = locate(noiseImage(10, 10, 1), noiseImage(11, 5, 2), 0.1);
  assert(!m.searched);
  assert(!m.found);
  std::cout << "test_template_too_large PASSED" << std::endl;
}

void test_gray_conversion() {
  std::cout << "Running test_gray_conversion..." << std::endl;
  Image px;
  px.w = 2;
  px.h = 1;
  px.channels = 3;
  px.pixels = {255, 0, 0, 10, 10, 10};
  GrayImage g = toGray(px);
  assert(g.w == 2 && g.h == 1);
  assert(std::fabs(g.at(0, 0) - 76.245f) < 0.01f);
  assert(std::fabs(g.at(1, 0) - 10.0f) < 0.01f);
  std::cout << "test_gray_conversion PASSED" << std::endl;
}

void test_rescale() {
  std::cout << "Running test_rescale..." << std::endl;
  Position p = rescaleToLogical({80, 60}, {200, 200}, {100, 100});
  assert(p == (Position{40, 30}));

  // scale 1.0 leaves the point alone
  Position same = rescaleToLogical({123, 45}, {1920, 1080}, {1920, 1080});
  assert(same == (Position{123, 45}));

  // per-axis, truncated
  Position hi = rescaleToLogical({2559, 1001}, {2560, 1440}, {1280, 720});
  assert(hi == (Position{1279, 500}));
  std::cout << "test_rescale PASSED" << std::endl;
}

int main() {
  test_exact_match();
  test_below_threshold();
  test_threshold_is_inclusive();
  test_flat_mismatch();
  test_template_too_large();
  test_gray_conversion();
  test_rescale();
  std::cout << "All template locator tests passed." << std::endl;
  return 0;
}
