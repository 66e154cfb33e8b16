/**
 * @file    test_compositor.cpp
 * @brief   Unit tests for overlay blending
 * @license MIT
 */

#include <gtest/gtest.h>
#include "core/compositor.hpp"
#include "core/types.hpp"

using namespace wit;

namespace {

const cv::Rect kRegion(10, 10, 20, 10);

cv::Mat white_overlay() {
    return cv::Mat(kRegion.size(), CV_8UC3, cv::Scalar::all(255));
}

}  // anonymous namespace

// =============================================================================
// Inversion decision
// =============================================================================

TEST(BlendOverlayTest, InversionIsAutoXorConfigured) {
    struct Case { int level; bool invert; bool expected; };
    const Case cases[] = {
        {200, false, true},
        {200, true,  false},
        {40,  false, false},
        {40,  true,  true},
    };

    for (const Case& c : cases) {
        cv::Mat bg(60, 60, CV_8UC3, cv::Scalar::all(c.level));
        const BlendReport report = blend_overlay(bg, white_overlay(), kRegion, 0.5, c.invert);

        EXPECT_EQ(report.auto_inverted, c.level > 127) << "level " << c.level;
        EXPECT_EQ(report.inverted, c.expected) << "level " << c.level << " invert " << c.invert;
        EXPECT_NEAR(report.luminance_factor, c.level / 255.0, 1e-6);
    }
}

TEST(BlendOverlayTest, FactorAtHalfDoesNotInvert) {
    cv::Mat bg(60, 60, CV_16UC3, cv::Scalar::all(32767.5));
    const RegionStat half{65535.0 / 2.0, 0.0};

    const BlendReport report = blend_overlay(bg, white_overlay(), kRegion, 0.5, false,
                                             MaskSource::ColorMagnitude, half);

    EXPECT_DOUBLE_EQ(report.luminance_factor, 0.5);
    EXPECT_FALSE(report.auto_inverted);
}

// =============================================================================
// Color magnitude mask
// =============================================================================

TEST(BlendOverlayTest, WhiteOverlayOnDarkRegion) {
    cv::Mat bg(60, 60, CV_8UC3, cv::Scalar::all(0));

    (void)blend_overlay(bg, white_overlay(), kRegion, 0.5, false);

    const cv::Vec3b inside = bg.at<cv::Vec3b>(15, 15);
    EXPECT_NEAR(inside[0], 128, 1);
    EXPECT_EQ(bg.at<cv::Vec3b>(5, 5), cv::Vec3b(0, 0, 0));
}

TEST(BlendOverlayTest, InvertedOverlayDarkensBrightRegion) {
    cv::Mat bg(60, 60, CV_8UC3, cv::Scalar::all(128));

    const BlendReport report = blend_overlay(bg, white_overlay(), kRegion, 0.5, false);

    EXPECT_TRUE(report.inverted);
    EXPECT_EQ(bg.at<cv::Vec3b>(15, 15), cv::Vec3b(64, 64, 64));
}

TEST(BlendOverlayTest, BlackOverlayLeavesBackground) {
    cv::Mat bg(60, 60, CV_8UC3, cv::Scalar(30, 60, 90));
    const cv::Mat before = bg.clone();
    const cv::Mat black(kRegion.size(), CV_8UC3, cv::Scalar::all(0));

    // Inverted or not, a zero mask keeps every pixel
    (void)blend_overlay(bg, black, kRegion, 1.0, true);

    EXPECT_EQ(cv::norm(bg, before, cv::NORM_INF), 0.0);
}

TEST(BlendOverlayTest, ZeroOpacityLeavesBackground) {
    cv::Mat bg(60, 60, CV_8UC3, cv::Scalar(30, 60, 90));
    const cv::Mat before = bg.clone();

    (void)blend_overlay(bg, white_overlay(), kRegion, 0.0, false);

    EXPECT_EQ(cv::norm(bg, before, cv::NORM_INF), 0.0);
}

// =============================================================================
// Alpha channel mask
// =============================================================================

TEST(BlendOverlayTest, AlphaMaskUsesOverlayAlpha) {
    cv::Mat bg(60, 60, CV_8UC3, cv::Scalar::all(0));
    cv::Mat overlay(kRegion.size(), CV_8UC4, cv::Scalar(0, 0, 255, 255));
    overlay(cv::Rect(0, 0, 10, 10)).setTo(cv::Scalar(0, 0, 255, 0));

    (void)blend_overlay(bg, overlay, kRegion, 1.0, false, MaskSource::AlphaChannel);

    // Opaque half takes the overlay color, transparent half is untouched
    EXPECT_EQ(bg.at<cv::Vec3b>(15, 25), cv::Vec3b(0, 0, 255));
    EXPECT_EQ(bg.at<cv::Vec3b>(15, 15), cv::Vec3b(0, 0, 0));
}

TEST(BlendOverlayTest, AlphaMaskWithoutAlphaIsOpaque) {
    cv::Mat bg(60, 60, CV_8UC3, cv::Scalar::all(0));
    const cv::Mat overlay(kRegion.size(), CV_8UC3, cv::Scalar::all(100));

    (void)blend_overlay(bg, overlay, kRegion, 1.0, false, MaskSource::AlphaChannel);

    EXPECT_EQ(bg.at<cv::Vec3b>(15, 15), cv::Vec3b(100, 100, 100));
}

// =============================================================================
// Buffer layouts
// =============================================================================

TEST(BlendOverlayTest, PreservesSixteenBitDepth) {
    cv::Mat bg(60, 60, CV_16UC3, cv::Scalar::all(10000));

    (void)blend_overlay(bg, white_overlay(), kRegion, 0.5, false);

    EXPECT_EQ(bg.type(), CV_16UC3);
    EXPECT_NEAR(bg.at<cv::Vec3w>(15, 15)[0], 0.5 * 10000 + 0.5 * 65535, 1.0);
    EXPECT_EQ(bg.at<cv::Vec3w>(5, 5)[0], 10000);
}

TEST(BlendOverlayTest, KeepsBackgroundAlpha) {
    cv::Mat bg(60, 60, CV_8UC4, cv::Scalar(0, 0, 0, 77));

    (void)blend_overlay(bg, white_overlay(), kRegion, 0.5, false);

    EXPECT_EQ(bg.type(), CV_8UC4);
    const cv::Vec4b px = bg.at<cv::Vec4b>(15, 15);
    EXPECT_NEAR(px[0], 128, 1);
    EXPECT_EQ(px[3], 77);
}

TEST(BlendOverlayTest, GrayscaleBackground) {
    cv::Mat bg(60, 60, CV_8UC1, cv::Scalar(0));

    (void)blend_overlay(bg, white_overlay(), kRegion, 1.0, false);

    EXPECT_EQ(bg.type(), CV_8UC1);
    EXPECT_EQ(bg.at<uchar>(15, 15), 255);
}

// =============================================================================
// Errors
// =============================================================================

TEST(BlendOverlayTest, RegionOutsideBackgroundThrows) {
    cv::Mat bg(60, 60, CV_8UC3, cv::Scalar::all(0));

    EXPECT_THROW((void)blend_overlay(bg, white_overlay(), cv::Rect(50, 10, 20, 10), 0.5, false),
                 OverlaySizeError);
}

TEST(BlendOverlayTest, OverlayRegionMismatchThrows) {
    cv::Mat bg(60, 60, CV_8UC3, cv::Scalar::all(0));
    const cv::Mat small(5, 5, CV_8UC3, cv::Scalar::all(255));

    EXPECT_THROW((void)blend_overlay(bg, small, kRegion, 0.5, false), std::invalid_argument);
}

// =============================================================================
// Helpers
// =============================================================================

TEST(EnsureAlphaTest, AddsOpaqueChannel) {
    const cv::Mat bgr(4, 4, CV_8UC3, cv::Scalar(1, 2, 3));
    const cv::Mat bgra = ensure_alpha(bgr);
    EXPECT_EQ(bgra.type(), CV_8UC4);
    EXPECT_EQ(bgra.at<cv::Vec4b>(0, 0), cv::Vec4b(1, 2, 3, 255));

    const cv::Mat gray16(4, 4, CV_16UC1, cv::Scalar(9));
    const cv::Mat gray_bgra = ensure_alpha(gray16);
    EXPECT_EQ(gray_bgra.type(), CV_16UC4);
    EXPECT_EQ(gray_bgra.at<cv::Vec4w>(0, 0)[3], 65535);
}

TEST(EnsureAlphaTest, KeepsExistingAlpha) {
    const cv::Mat bgra(4, 4, CV_8UC4, cv::Scalar(1, 2, 3, 4));
    EXPECT_EQ(ensure_alpha(bgra).at<cv::Vec4b>(0, 0), cv::Vec4b(1, 2, 3, 4));
}

TEST(FitOverlayTest, ShrinksPreservingAspect) {
    const cv::Mat overlay(200, 400, CV_8UC3, cv::Scalar::all(255));

    const cv::Mat fitted = fit_overlay(overlay, {800, 600}, 0.2);

    EXPECT_EQ(fitted.size(), cv::Size(160, 80));
}

TEST(FitOverlayTest, NeverEnlarges) {
    const cv::Mat overlay(50, 100, CV_8UC3, cv::Scalar::all(255));

    EXPECT_EQ(fit_overlay(overlay, {800, 600}, 1.0).size(), overlay.size());
    EXPECT_THROW((void)fit_overlay(overlay, {800, 600}, 0.0), std::invalid_argument);
}

TEST(CompositeLayerTest, StraightAlphaOver) {
    cv::Mat bg(10, 10, CV_8UC3, cv::Scalar::all(0));
    cv::Mat layer(10, 10, CV_8UC4, cv::Scalar::all(0));
    layer.at<cv::Vec4b>(1, 1) = cv::Vec4b(255, 255, 255, 255);
    layer.at<cv::Vec4b>(2, 2) = cv::Vec4b(255, 255, 255, 51);

    composite_layer(bg, layer);

    EXPECT_EQ(bg.at<cv::Vec3b>(1, 1), cv::Vec3b(255, 255, 255));
    EXPECT_NEAR(bg.at<cv::Vec3b>(2, 2)[0], 51, 1);
    EXPECT_EQ(bg.at<cv::Vec3b>(5, 5), cv::Vec3b(0, 0, 0));
}

TEST(CompositeLayerTest, RejectsMismatchedLayer) {
    cv::Mat bg(10, 10, CV_8UC3, cv::Scalar::all(0));

    EXPECT_THROW(composite_layer(bg, cv::Mat(10, 10, CV_8UC3, cv::Scalar::all(0))), std::invalid_argument);
    EXPECT_THROW(composite_layer(bg, cv::Mat(5, 5, CV_8UC4, cv::Scalar::all(0))), std::invalid_argument);
}
