#include "beam_analysis/analysis/flux.hpp"
#include "beam_analysis/core/errors.hpp"
#include "beam_analysis/core/types.hpp"

#include <limits>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using beam_analysis::InvalidExposureTime;
using beam_analysis::Matrix2Dd;
using beam_analysis::PixelPosition;
using namespace beam_analysis::analysis;

TEST_CASE("flux_of_uniform_frame_centered_window") {
    Matrix2Dd f = Matrix2Dd::Ones(100, 100);

    auto fr = integrate_flux(f, PixelPosition{50.0, 50.0}, 2.0, 25);

    REQUIRE(fr.roi.row_min == 25);
    REQUIRE(fr.roi.row_max == 75);
    REQUIRE(fr.roi.col_min == 25);
    REQUIRE(fr.roi.col_max == 75);
    REQUIRE(fr.roi_pixels == 2601);
    REQUIRE(fr.integrated_intensity == Catch::Approx(2601.0));
    REQUIRE(fr.flux == Catch::Approx(1300.5));
}

TEST_CASE("flux_window_is_truncated_at_frame_edges") {
    Matrix2Dd f = Matrix2Dd::Ones(100, 100);

    auto fr = integrate_flux(f, PixelPosition{2.0, 2.0}, 1.0, 25);

    REQUIRE(fr.roi.row_min == 0);
    REQUIRE(fr.roi.row_max == 27);
    REQUIRE(fr.roi.col_min == 0);
    REQUIRE(fr.roi.col_max == 27);
    REQUIRE(fr.integrated_intensity == Catch::Approx(784.0));
    REQUIRE(fr.flux == Catch::Approx(784.0));
}

TEST_CASE("roi_window_floors_fractional_centers") {
    auto w = compute_roi_window(PixelPosition{10.6, 3.2}, 2, 20, 20);
    REQUIRE(w.row_min == 8);
    REQUIRE(w.row_max == 12);
    REQUIRE(w.col_min == 1);
    REQUIRE(w.col_max == 5);

    auto far = compute_roi_window(PixelPosition{19.0, 19.0}, 5, 20, 20);
    REQUIRE(far.row_max == 19);
    REQUIRE(far.col_max == 19);
    REQUIRE(far.rows() == 6);

    REQUIRE_THROWS_AS(compute_roi_window(PixelPosition{1.0, 1.0}, -1, 20, 20),
                      beam_analysis::ValidationError);
    REQUIRE_THROWS_AS(compute_roi_window(
                          PixelPosition{std::numeric_limits<double>::quiet_NaN(), 1.0}, 2, 20, 20),
                      beam_analysis::ValidationError);
}

TEST_CASE("zero_roi_size_integrates_one_pixel") {
    Matrix2Dd f = Matrix2Dd::Zero(5, 5);
    f(2, 3) = 7.0;
    f(2, 2) = 100.0;

    auto fr = integrate_flux(f, PixelPosition{2.4, 3.9}, 0.5, 0);

    REQUIRE(fr.roi_pixels == 1);
    REQUIRE(fr.integrated_intensity == Catch::Approx(7.0));
    REQUIRE(fr.flux == Catch::Approx(14.0));
}

TEST_CASE("non_positive_exposure_time_is_rejected") {
    Matrix2Dd f = Matrix2Dd::Ones(10, 10);

    REQUIRE_THROWS_AS(integrate_flux(f, PixelPosition{5.0, 5.0}, 0.0), InvalidExposureTime);
    REQUIRE_THROWS_AS(integrate_flux(f, PixelPosition{5.0, 5.0}, -1.0), InvalidExposureTime);
    REQUIRE_THROWS_AS(check_exposure_time(std::numeric_limits<double>::quiet_NaN()),
                      InvalidExposureTime);
    REQUIRE_NOTHROW(check_exposure_time(1e-6));
}

TEST_CASE("window_outside_the_frame_integrates_nothing") {
    Matrix2Dd f = Matrix2Dd::Ones(100, 100);

    auto above = integrate_flux(f, PixelPosition{-100.0, 50.0}, 1.0, 25);
    REQUIRE(above.roi.empty());
    REQUIRE(above.roi_pixels == 0);
    REQUIRE(above.integrated_intensity == 0.0);
    REQUIRE(above.flux == 0.0);

    auto beyond = compute_roi_window(PixelPosition{500.0, 500.0}, 25, 100, 100);
    REQUIRE(beyond.empty());
    REQUIRE(beyond.rows() == 0);

    // one axis overlapping is not enough
    REQUIRE(compute_roi_window(PixelPosition{50.0, 200.0}, 25, 100, 100).empty());

    // a window that just reaches the border keeps its overlap
    auto edge = compute_roi_window(PixelPosition{-25.0, 50.0}, 25, 100, 100);
    REQUIRE(edge.row_min == 0);
    REQUIRE(edge.row_max == 0);
    REQUIRE(edge.cols() == 51);
}
