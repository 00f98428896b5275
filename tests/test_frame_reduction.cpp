#include "beam_analysis/core/errors.hpp"
#include "beam_analysis/core/types.hpp"
#include "beam_analysis/image/frame_reduction.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using beam_analysis::DetectorStack;
using beam_analysis::Matrix2Dd;
using beam_analysis::ShapeError;
using beam_analysis::image::mean_over_leading_axis;
using beam_analysis::image::reduce_to_2d;

TEST_CASE("reduce_to_2d_returns_rank2_input_unchanged") {
    DetectorStack s;
    s.shape = {2, 3};
    s.data = {1, 2, 3, 4, 5, 6};

    Matrix2Dd f = reduce_to_2d(s);

    REQUIRE(f.rows() == 2);
    REQUIRE(f.cols() == 3);
    REQUIRE(f(0, 0) == 1.0);
    REQUIRE(f(0, 2) == 3.0);
    REQUIRE(f(1, 0) == 4.0);
    REQUIRE(f(1, 2) == 6.0);
}

TEST_CASE("reduce_to_2d_averages_repeats_of_a_3d_stack") {
    DetectorStack s;
    s.shape = {3, 2, 2};
    s.data = {0, 1, 2, 3,
              3, 4, 5, 6,
              6, 7, 8, 9};

    Matrix2Dd f = reduce_to_2d(s);

    REQUIRE(f.rows() == 2);
    REQUIRE(f.cols() == 2);
    REQUIRE(f(0, 0) == Catch::Approx(3.0));
    REQUIRE(f(0, 1) == Catch::Approx(4.0));
    REQUIRE(f(1, 0) == Catch::Approx(5.0));
    REQUIRE(f(1, 1) == Catch::Approx(6.0));
}

TEST_CASE("reduce_to_2d_collapses_all_leading_axes_of_a_4d_stack") {
    DetectorStack s;
    s.shape = {2, 2, 1, 2};
    s.data = {1, 1,
              3, 3,
              5, 5,
              7, 7};

    Matrix2Dd f = reduce_to_2d(s);

    REQUIRE(f.rows() == 1);
    REQUIRE(f.cols() == 2);
    REQUIRE(f(0, 0) == Catch::Approx(4.0));
    REQUIRE(f(0, 1) == Catch::Approx(4.0));
}

TEST_CASE("reduce_to_2d_rejects_rank1_and_rank0") {
    DetectorStack line;
    line.shape = {4};
    line.data = {1, 2, 3, 4};
    REQUIRE_THROWS_AS(reduce_to_2d(line), ShapeError);

    DetectorStack scalar;
    scalar.data = {1};
    REQUIRE_THROWS_AS(reduce_to_2d(scalar), ShapeError);
}

TEST_CASE("reduce_to_2d_rejects_zero_length_axes_and_size_mismatch") {
    DetectorStack empty;
    empty.shape = {0, 4, 4};
    REQUIRE_THROWS_AS(reduce_to_2d(empty), ShapeError);

    DetectorStack short_data;
    short_data.shape = {2, 2};
    short_data.data = {1, 2, 3};
    REQUIRE_THROWS_AS(reduce_to_2d(short_data), ShapeError);
}

TEST_CASE("mean_over_leading_axis_drops_one_axis") {
    DetectorStack s;
    s.shape = {2, 1, 1, 3};
    s.data = {0, 2, 4, 2, 4, 6};

    DetectorStack m = mean_over_leading_axis(s);

    REQUIRE(m.shape == std::vector<size_t>{1, 1, 3});
    REQUIRE(m.data[0] == Catch::Approx(1.0));
    REQUIRE(m.data[1] == Catch::Approx(3.0));
    REQUIRE(m.data[2] == Catch::Approx(5.0));

    DetectorStack flat;
    flat.shape = {2, 2};
    flat.data = {1, 2, 3, 4};
    REQUIRE_THROWS_AS(mean_over_leading_axis(flat), ShapeError);
}
