#include <doctest/doctest.h>
#include <opencv2/core.hpp>
#include "persondet/common.hpp"

using namespace persondet;

TEST_CASE("letterbox pads the short side"){
  cv::Mat img(320, 640, CV_8UC3, cv::Scalar(255, 255, 255));
  auto prep = preprocess_letterbox(img, 640, 640);
  CHECK(prep.scale==doctest::Approx(1.0));
  CHECK(prep.pad_x==0);
  CHECK(prep.pad_y==160);
  CHECK(prep.input_tensor.size()==3u*640*640);
  CHECK(prep.letterbox_image.size()==cv::Size(640, 640));
  // top padding row is grey, image rows are white
  CHECK(prep.input_tensor[0]==doctest::Approx(114.0 / 255.0));
  CHECK(prep.input_tensor[320 * 640]==doctest::Approx(1.0));
}

TEST_CASE("unletterboxBox maps back and clamps"){
  cv::Mat img(320, 640, CV_8UC3);
  auto prep = preprocess_letterbox(img, 640, 640);

  auto r = unletterboxBox(100, 200, 300, 400, prep, img.cols, img.rows);
  CHECK(r.x==doctest::Approx(100));
  CHECK(r.y==doctest::Approx(40));
  CHECK(r.width==doctest::Approx(200));
  CHECK(r.height==doctest::Approx(200));

  auto clipped = unletterboxBox(-50, 100, 700, 600, prep, img.cols, img.rows);
  CHECK(clipped.x==doctest::Approx(0));
  CHECK(clipped.y==doctest::Approx(0));
  CHECK(clipped.x + clipped.width==doctest::Approx(639));
  CHECK(clipped.y + clipped.height==doctest::Approx(319));
}

TEST_CASE("unletterboxBox keeps inverted boxes non-positive"){
  cv::Mat img(100, 100, CV_8UC3);
  auto prep = preprocess_letterbox(img, 100, 100);
  auto r = unletterboxBox(50, 50, 40, 60, prep, img.cols, img.rows);
  CHECK(r.width<0.f);
}

TEST_CASE("string helpers"){
  CHECK(toLower("CUDA")=="cuda");
  CHECK(toLower(".MP4")==".mp4");
  CHECK(resolutionString(1920, 1080)=="1920x1080");
}
