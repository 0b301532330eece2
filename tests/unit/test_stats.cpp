#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <stdexcept>
#include "persondet/stats.hpp"

using namespace persondet;

TEST_CASE("RollingWindow rejects zero capacity"){
  CHECK_THROWS_AS(RollingWindow(0), std::invalid_argument);
}

TEST_CASE("RollingWindow mean of partial window"){
  RollingWindow w(4);
  CHECK(w.empty());
  CHECK(w.mean()==doctest::Approx(0.0));
  w.push(1.0); w.push(3.0);
  CHECK(w.size()==2);
  CHECK(w.mean()==doctest::Approx(2.0));
}

TEST_CASE("RollingWindow keeps only the newest values"){
  RollingWindow w(3);
  for(double v : {1.0, 2.0, 3.0, 4.0, 5.0}) w.push(v);
  CHECK(w.size()==3);
  CHECK(w.capacity()==3);
  CHECK(w.sum()==doctest::Approx(12.0));
  CHECK(w.mean()==doctest::Approx(4.0));
}

TEST_CASE("rollingFps averages the last 30 durations"){
  ProcessingStats s;
  CHECK_FALSE(s.hasTiming());
  CHECK(s.rollingFps()==doctest::Approx(0.0));

  for(int i=0;i<10;++i) s.recordDuration(1.0);
  for(int i=0;i<30;++i) s.recordDuration(0.05);
  CHECK(s.hasTiming());
  CHECK(s.rollingFps()==doctest::Approx(20.0));
}

TEST_CASE("rollingFps is zero for zero durations"){
  ProcessingStats s;
  s.recordDuration(0.0);
  CHECK(s.rollingFps()==doctest::Approx(0.0));
}

TEST_CASE("finalize with no frames"){
  ProcessingStats s;
  auto sum = s.finalize(0.0, "640x480", "out.mp4");
  CHECK(sum.total_frames==0);
  CHECK(sum.avg_fps==doctest::Approx(0.0));
  CHECK(sum.avg_persons==doctest::Approx(0.0));
  CHECK(sum.max_persons==0);
  CHECK(sum.min_persons==0);
  CHECK(sum.video_resolution=="640x480");
  CHECK(sum.output_path=="out.mp4");
}

TEST_CASE("finalize person statistics"){
  ProcessingStats s;
  for(std::size_t n : {2u, 0u, 5u, 1u}){ s.recordPersons(n); s.recordDuration(0.1); s.nextFrame(); }
  auto sum = s.finalize(2.0, "1920x1080", "out.mp4");

  CHECK(sum.total_frames==4);
  CHECK(s.personCounts().size()==4);
  CHECK(sum.avg_fps==doctest::Approx(2.0));
  CHECK(sum.avg_persons==doctest::Approx(2.0));
  CHECK(sum.min_persons==0);
  CHECK(sum.max_persons==5);
  CHECK(sum.min_persons<=sum.avg_persons);
  CHECK(sum.avg_persons<=sum.max_persons);
}

TEST_CASE("finalize with constant count"){
  ProcessingStats s;
  for(int i=0;i<7;++i){ s.recordPersons(3); s.nextFrame(); }
  auto sum = s.finalize(1.0, "2x2", "");
  CHECK(sum.min_persons==3);
  CHECK(sum.max_persons==3);
  CHECK(sum.avg_persons==doctest::Approx(3.0));
}
