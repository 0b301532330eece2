#include <doctest/doctest.h>
#include <stdexcept>
#include <vector>
#include "persondet/postprocess.hpp"

using namespace persondet;

namespace {

// Letterbox of a 640x640 image into 640x640: identity mapping.
PreprocessInfo identity(){ return PreprocessInfo{{}, 1.0f, 0, 0, cv::Mat()}; }

// Raw [1, 4 + classes, N] buffer filled box by box.
struct RawTensor {
  int classes, boxes;
  std::vector<float> data;
  RawTensor(int c, int n) : classes(c), boxes(n), data(static_cast<std::size_t>(4 + c) * n, 0.f) {}
  void set(int i, float cx, float cy, float w, float h, std::vector<float> scores){
    at(0, i)=cx; at(1, i)=cy; at(2, i)=w; at(3, i)=h;
    for(int c=0;c<classes;++c) at(4 + c, i)=scores[c];
  }
  float& at(int attr, int i){ return data[static_cast<std::size_t>(attr) * boxes + i]; }
  std::vector<int64_t> shape() const { return {1, 4 + classes, boxes}; }
};

}  // namespace

TEST_CASE("end-to-end rows keep only the target class above threshold"){
  std::vector<float> rows = {
    10, 20, 110, 220, 0.90f, 0,
    50, 50, 150, 150, 0.95f, 1,
    30, 30, 60, 60, 0.20f, 0,
  };
  DetectorConfig cfg;
  auto dets = decodeDetections(rows.data(), {1, 3, 6}, identity(), cv::Size(640, 640), cfg);

  REQUIRE(dets.size()==1);
  CHECK(dets[0].bbox==std::array<int, 4>{10, 20, 110, 220});
  CHECK(dets[0].confidence==doctest::Approx(0.9));
  CHECK(dets[0].label=="person");
  CHECK(dets[0].class_id==0);
}

TEST_CASE("end-to-end rows are not suppressed again"){
  std::vector<float> rows = {
    10, 10, 110, 110, 0.9f, 0,
    12, 10, 112, 110, 0.8f, 0,
  };
  DetectorConfig cfg;
  auto dets = decodeDetections(rows.data(), {1, 2, 6}, identity(), cv::Size(640, 640), cfg);
  CHECK(dets.size()==2);
}

TEST_CASE("boxes map back through the letterbox"){
  // 1280x960 letterboxed into 640x640: scale 0.5, 80 rows of padding on top.
  PreprocessInfo prep{{}, 0.5f, 0, 80, cv::Mat()};
  std::vector<float> rows = {100, 180, 300, 380, 0.7f, 0};
  DetectorConfig cfg;
  auto dets = decodeDetections(rows.data(), {1, 1, 6}, prep, cv::Size(1280, 960), cfg);

  REQUIRE(dets.size()==1);
  CHECK(dets[0].bbox==std::array<int, 4>{200, 200, 600, 600});
}

TEST_CASE("boxes that collapse after clamping are dropped"){
  std::vector<float> rows = {
    700, 700, 800, 800, 0.9f, 0,  // outside the image
    50, 50, 40, 90, 0.9f, 0,      // x2 < x1
    -40, 10, 0, 60, 0.9f, 0,      // left of the image
    5, 5, 25, 25, 0.9f, 0,
  };
  DetectorConfig cfg;
  auto dets = decodeDetections(rows.data(), {1, 4, 6}, identity(), cv::Size(640, 640), cfg);

  REQUIRE(dets.size()==1);
  CHECK(dets[0].bbox==std::array<int, 4>{5, 5, 25, 25});
}

TEST_CASE("raw output keeps a box only when its best class is the target"){
  RawTensor t(2, 3);
  t.set(0, 100, 100, 40, 80, {0.80f, 0.10f});
  t.set(1, 300, 300, 40, 80, {0.40f, 0.90f});  // bicycle with a passing person score
  t.set(2, 500, 500, 40, 80, {0.20f, 0.05f});
  DetectorConfig cfg;
  auto dets = decodeDetections(t.data.data(), t.shape(), identity(), cv::Size(640, 640), cfg);

  REQUIRE(dets.size()==1);
  CHECK(dets[0].bbox==std::array<int, 4>{80, 60, 120, 140});
  CHECK(dets[0].confidence==doctest::Approx(0.8));
}

TEST_CASE("raw output suppresses overlapping boxes"){
  RawTensor t(1, 3);
  t.set(0, 100, 100, 100, 100, {0.9f});
  t.set(1, 105, 100, 100, 100, {0.8f});
  t.set(2, 400, 400, 50, 50, {0.7f});
  DetectorConfig cfg;
  auto dets = decodeDetections(t.data.data(), t.shape(), identity(), cv::Size(640, 640), cfg);

  REQUIRE(dets.size()==2);
  CHECK(dets[0].confidence==doctest::Approx(0.9));
  CHECK(dets[0].bbox==std::array<int, 4>{50, 50, 150, 150});
  CHECK(dets[1].confidence==doctest::Approx(0.7));
}

TEST_CASE("raw output keeps boxes that overlap below the iou threshold"){
  RawTensor t(1, 2);
  t.set(0, 100, 100, 100, 100, {0.9f});
  t.set(1, 160, 100, 100, 100, {0.8f});  // iou 0.25
  DetectorConfig cfg;
  auto dets = decodeDetections(t.data.data(), t.shape(), identity(), cv::Size(640, 640), cfg);
  CHECK(dets.size()==2);
}

TEST_CASE("raw output without the target class yields nothing"){
  RawTensor t(1, 2);
  t.set(0, 100, 100, 100, 100, {0.9f});
  DetectorConfig cfg;
  cfg.target_class = 3;
  CHECK(decodeDetections(t.data.data(), t.shape(), identity(), cv::Size(640, 640), cfg).empty());
}

TEST_CASE("unexpected output shapes are rejected"){
  std::vector<float> data(12, 0.f);
  DetectorConfig cfg;
  CHECK_THROWS_AS(decodeDetections(data.data(), {1, 12}, identity(), cv::Size(640, 640), cfg),
                  std::runtime_error);
  CHECK_THROWS_AS(decodeDetections(data.data(), {1, 4, 3}, identity(), cv::Size(640, 640), cfg),
                  std::runtime_error);
}
