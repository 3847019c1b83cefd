#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/gallery.hpp"
#include "core/identity_resolver.hpp"
#include "fakes.hpp"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace {

std::string encode_png(const cv::Mat& image) {
    std::vector<uchar> buf;
    cv::imencode(".png", image, buf);
    return std::string(buf.begin(), buf.end());
}

}

TEST_CASE("padded crop is clamped to the frame") {
    const cv::Size frame(100, 100);
    CHECK(padded_crop_rect(cv::Rect(5, 5, 20, 20), 10, frame) == cv::Rect(0, 0, 35, 35));
    CHECK(padded_crop_rect(cv::Rect(30, 30, 20, 20), 10, frame) == cv::Rect(20, 20, 40, 40));
    CHECK(padded_crop_rect(cv::Rect(90, 90, 30, 30), 10, frame) == cv::Rect(80, 80, 20, 20));
    CHECK(padded_crop_rect(cv::Rect(200, 200, 10, 10), 10, frame).empty());
}

TEST_CASE("first matching reference wins, confidence is one minus distance") {
    Gallery gallery(make_gallery_dir({ "alice", "bob" }));
    REQUIRE(gallery.reload());
    FakeVerifier verifier;
    verifier.outcomes["alice"] = { VerifyStatus::Matched, 0.2f, false };
    verifier.outcomes["bob"] = { VerifyStatus::Matched, 0.1f, false };
    IdentityResolver resolver(gallery, &verifier);

    Resolution r = resolver.resolve(blank_frame(), cv::Rect(100, 100, 80, 200));
    CHECK(r.attempted);
    CHECK(r.identity.name == "alice");
    CHECK(r.identity.is_known);
    CHECK(r.identity.confidence == doctest::Approx(0.8f));
    // stopped at the first match
    REQUIRE(verifier.calls.size() == 1);
    CHECK(verifier.calls[0] == "alice");
}

TEST_CASE("verifier errors are treated as no match") {
    Gallery gallery(make_gallery_dir({ "alice", "bob" }));
    REQUIRE(gallery.reload());
    FakeVerifier verifier;
    verifier.outcomes["bob"] = { VerifyStatus::Matched, 0.3f, false };

    SUBCASE("error status") {
        verifier.outcomes["alice"] = { VerifyStatus::Error, 1.0f, false };
    }
    SUBCASE("thrown exception") {
        verifier.outcomes["alice"] = { VerifyStatus::Error, 1.0f, true };
    }

    IdentityResolver resolver(gallery, &verifier);
    Resolution r = resolver.resolve(blank_frame(), cv::Rect(100, 100, 80, 200));
    CHECK(r.identity.name == "bob");
    CHECK(r.identity.confidence == doctest::Approx(0.7f));
    CHECK(verifier.calls.size() == 2);
}

TEST_CASE("no match across the gallery gives unknown") {
    Gallery gallery(make_gallery_dir({ "alice", "bob", "carol" }));
    REQUIRE(gallery.reload());
    FakeVerifier verifier;
    verifier.outcomes["carol"] = { VerifyStatus::Error, 1.0f, true };
    IdentityResolver resolver(gallery, &verifier);

    Resolution r = resolver.resolve(blank_frame(), cv::Rect(100, 100, 80, 200));
    CHECK(r.attempted);
    CHECK(r.identity.name == IDENTITY_UNKNOWN);
    CHECK_FALSE(r.identity.is_known);
    CHECK(r.identity.confidence == doctest::Approx(0.0f));
    CHECK(resolver.verify_calls() == 3);
}

TEST_CASE("verifier is notified once per resolved crop") {
    Gallery gallery(make_gallery_dir({ "alice", "bob", "carol" }));
    REQUIRE(gallery.reload());
    FakeVerifier verifier;
    IdentityResolver resolver(gallery, &verifier);

    resolver.resolve(blank_frame(), cv::Rect(100, 100, 80, 200));
    CHECK(verifier.calls.size() == 3);
    CHECK(verifier.new_probes == 1);

    resolver.resolve(blank_frame(), cv::Rect(200, 100, 80, 200));
    CHECK(verifier.calls.size() == 6);
    CHECK(verifier.new_probes == 2);

    Gallery empty(make_gallery_dir({}));
    REQUIRE(empty.reload());
    FakeVerifier idle;
    IdentityResolver unavailable(empty, &idle);
    unavailable.resolve(blank_frame(), cv::Rect(100, 100, 80, 200));
    CHECK(idle.new_probes == 0);
}

TEST_CASE("resolution is repeatable for an unchanged gallery") {
    Gallery gallery(make_gallery_dir({ "alice" }));
    REQUIRE(gallery.reload());
    FakeVerifier verifier;
    verifier.outcomes["alice"] = { VerifyStatus::Matched, 0.25f, false };
    IdentityResolver resolver(gallery, &verifier);

    const cv::Mat frame = blank_frame();
    Resolution first = resolver.resolve(frame, cv::Rect(50, 60, 100, 120));
    Resolution second = resolver.resolve(frame, cv::Rect(50, 60, 100, 120));
    CHECK(first.identity.name == second.identity.name);
    CHECK(first.identity.confidence == doctest::Approx(second.identity.confidence));
    CHECK(first.identity.is_known == second.identity.is_known);
}

TEST_CASE("empty gallery is not attempted") {
    Gallery gallery(make_gallery_dir({}));
    REQUIRE(gallery.reload());
    FakeVerifier verifier;
    IdentityResolver resolver(gallery, &verifier);

    CHECK_FALSE(resolver.available());
    Resolution r = resolver.resolve(blank_frame(), cv::Rect(100, 100, 80, 200));
    CHECK_FALSE(r.attempted);
    CHECK(r.identity.name == IDENTITY_NOT_ATTEMPTED);
    CHECK(verifier.calls.empty());
}

TEST_CASE("box entirely off frame resolves to unknown without verifying") {
    Gallery gallery(make_gallery_dir({ "alice" }));
    REQUIRE(gallery.reload());
    FakeVerifier verifier;
    IdentityResolver resolver(gallery, &verifier);

    Resolution r = resolver.resolve(blank_frame(), cv::Rect());
    CHECK(r.attempted);
    CHECK(r.identity.name == IDENTITY_UNKNOWN);
    CHECK(verifier.calls.empty());
}

TEST_CASE("gallery changes are picked up on refresh") {
    Gallery gallery(make_gallery_dir({ "alice" }));
    REQUIRE(gallery.reload());
    FakeVerifier verifier;
    verifier.outcomes["zed"] = { VerifyStatus::Matched, 0.1f, false };
    IdentityResolver resolver(gallery, &verifier);
    CHECK(resolver.gallery_size() == 1);

    std::string error;
    cv::Mat face(40, 30, CV_8UC3, cv::Scalar(10, 200, 10));
    REQUIRE(gallery.add_reference("zed.png", encode_png(face), error));
    CHECK(gallery.size() == 2);

    // snapshot is held until refresh
    CHECK(resolver.gallery_size() == 1);
    resolver.refresh();
    CHECK(resolver.gallery_size() == 2);
    CHECK(verifier.reloads == 1);

    Resolution r = resolver.resolve(blank_frame(), cv::Rect(100, 100, 80, 200));
    CHECK(r.identity.name == "zed");

    REQUIRE(gallery.remove_reference("zed"));
    resolver.refresh();
    CHECK(resolver.gallery_size() == 1);
    CHECK(verifier.reloads == 2);

    // no change, no reload
    resolver.refresh();
    CHECK(verifier.reloads == 2);
}

TEST_CASE("gallery rejects bad uploads") {
    Gallery gallery(make_gallery_dir({}));
    REQUIRE(gallery.reload());
    std::string error;
    cv::Mat face(40, 30, CV_8UC3, cv::Scalar(10, 200, 10));

    CHECK_FALSE(gallery.add_reference("../escape.png", encode_png(face), error));
    CHECK_FALSE(gallery.add_reference("notes.txt", "hello", error));
    CHECK_FALSE(gallery.add_reference("broken.jpg", "not an image", error));
    CHECK(error == "invalid image");
    CHECK_FALSE(gallery.remove_reference("nobody"));
    CHECK(gallery.size() == 0);
}

TEST_CASE("gallery lists references in name order") {
    Gallery gallery(make_gallery_dir({ "carol", "alice", "bob" }));
    REQUIRE(gallery.reload());
    std::vector<std::string> expected = { "alice", "bob", "carol" };
    CHECK(gallery.names() == expected);
}

TEST_CASE("concurrent uploads all land in the gallery") {
    Gallery gallery(make_gallery_dir({}));
    REQUIRE(gallery.reload());
    const std::string png = encode_png(cv::Mat(40, 30, CV_8UC3, cv::Scalar(10, 200, 10)));

    std::vector<bool> ok_a(5, false), ok_b(5, false);
    auto upload = [&](const std::string& prefix, std::vector<bool>& ok) {
        for (int i = 0; i < 5; ++i) {
            std::string error;
            ok[i] = gallery.add_reference(prefix + std::to_string(i) + ".png", png, error);
        }
    };
    std::thread a(upload, "ann", std::ref(ok_a));
    std::thread b(upload, "ben", std::ref(ok_b));
    a.join();
    b.join();

    for (int i = 0; i < 5; ++i) {
        CHECK(ok_a[i]);
        CHECK(ok_b[i]);
    }
    REQUIRE(gallery.size() == 10);
    const std::vector<std::string> names = gallery.names();
    for (int i = 0; i < 5; ++i) {
        CHECK(std::find(names.begin(), names.end(), "ann" + std::to_string(i)) != names.end());
        CHECK(std::find(names.begin(), names.end(), "ben" + std::to_string(i)) != names.end());
    }
}
