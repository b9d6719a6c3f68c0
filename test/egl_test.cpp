#include <gtest/gtest.h>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <egli/egl.hpp>

#include "fake_egl.hpp"

using egli::call_errc;
using egli::test::fake_egl_t;
namespace egl = egli::egl;

namespace {

struct call_case_t final {
    call_errc expected;
    std::function<std::error_code()> invoke;
};

std::vector<call_case_t> make_cases() {
    const EGLDisplay display = fake_egl_t::get_display_handle();
    const EGLConfig config = fake_egl_t::get_config_handle(0);
    const auto surface = reinterpret_cast<EGLSurface>(0x2000);
    const auto context = reinterpret_cast<EGLContext>(0x1000);
    const EGLint attrs[]{EGL_NONE};
    return {
        {call_errc::bind_api, [] { return egl::bind_api(EGL_OPENGL_ES_API); }},
        {call_errc::bind_tex_image,
         [=] { return egl::bind_tex_image(display, surface, EGL_BACK_BUFFER); }},
        {call_errc::choose_config,
         [=] {
             EGLint count = 0;
             return egl::num_filtered_configs(display, attrs, count);
         }},
        {call_errc::copy_buffers, [=] { return egl::copy_buffers(display, surface, 0); }},
        {call_errc::create_context,
         [=] {
             EGLContext output = EGL_NO_CONTEXT;
             return egl::create_context(display, config, EGL_NO_CONTEXT, nullptr, output);
         }},
        {call_errc::create_pbuffer_from_client_buffer,
         [=] {
             EGLSurface output = EGL_NO_SURFACE;
             return egl::create_pbuffer_from_client_buffer(display, EGL_OPENVG_IMAGE, nullptr, config, nullptr,
                                                           output);
         }},
        {call_errc::create_pbuffer_surface,
         [=] {
             EGLSurface output = EGL_NO_SURFACE;
             return egl::create_pbuffer_surface(display, config, nullptr, output);
         }},
        {call_errc::create_pixmap_surface,
         [=] {
             EGLSurface output = EGL_NO_SURFACE;
             return egl::create_pixmap_surface(display, config, 0, nullptr, output);
         }},
        {call_errc::create_platform_window_surface,
         [=] {
             EGLSurface output = EGL_NO_SURFACE;
             return egl::create_platform_window_surface(display, config, nullptr, nullptr, output);
         }},
        {call_errc::create_window_surface,
         [=] {
             EGLSurface output = EGL_NO_SURFACE;
             return egl::create_window_surface(display, config, 0, nullptr, output);
         }},
        {call_errc::destroy_context, [=] { return egl::destroy_context(display, context); }},
        {call_errc::destroy_surface, [=] { return egl::destroy_surface(display, surface); }},
        {call_errc::get_config_attrib,
         [=] {
             EGLint value = 0;
             return egl::get_config_attrib(display, config, EGL_RED_SIZE, value);
         }},
        {call_errc::get_configs,
         [=] {
             EGLint count = 0;
             return egl::num_configs(display, count);
         }},
        {call_errc::get_current_context,
         [] {
             EGLContext output = EGL_NO_CONTEXT;
             return egl::get_current_context(output);
         }},
        {call_errc::get_current_display,
         [] {
             EGLDisplay output = EGL_NO_DISPLAY;
             return egl::get_current_display(output);
         }},
        {call_errc::get_current_surface,
         [] {
             EGLSurface output = EGL_NO_SURFACE;
             return egl::get_current_surface(EGL_DRAW, output);
         }},
        {call_errc::get_display,
         [] {
             EGLDisplay output = EGL_NO_DISPLAY;
             return egl::get_display(EGL_DEFAULT_DISPLAY, output);
         }},
        {call_errc::get_proc_address,
         [] {
             __eglMustCastToProperFunctionPointerType proc = nullptr;
             return egl::get_proc_address("glClear", proc);
         }},
        {call_errc::initialize, [=] { return egl::initialize(display); }},
        {call_errc::make_current,
         [=] { return egl::make_current(display, EGL_NO_SURFACE, EGL_NO_SURFACE, EGL_NO_CONTEXT); }},
        {call_errc::query_context,
         [=] {
             EGLint value = 0;
             return egl::query_context(display, context, EGL_CONTEXT_CLIENT_TYPE, value);
         }},
        {call_errc::query_string,
         [=] {
             std::string_view text{};
             return egl::query_string(display, EGL_VENDOR, text);
         }},
        {call_errc::query_surface,
         [=] {
             EGLint value = 0;
             return egl::query_surface(display, surface, EGL_WIDTH, value);
         }},
        {call_errc::release_tex_image,
         [=] { return egl::release_tex_image(display, surface, EGL_BACK_BUFFER); }},
        {call_errc::release_thread, [] { return egl::release_thread(); }},
        {call_errc::surface_attrib,
         [=] { return egl::surface_attrib(display, surface, EGL_SWAP_BEHAVIOR, EGL_BUFFER_DESTROYED); }},
        {call_errc::swap_buffers, [=] { return egl::swap_buffers(display, surface); }},
        {call_errc::swap_interval, [=] { return egl::swap_interval(display, 1); }},
        {call_errc::terminate, [=] { return egl::terminate(display); }},
        {call_errc::wait_client, [] { return egl::wait_client(); }},
        {call_errc::wait_gl, [] { return egl::wait_gl(); }},
        {call_errc::wait_native, [] { return egl::wait_native(EGL_CORE_NATIVE_ENGINE); }},
    };
}

} // namespace

TEST(egl, every_failure_reports_its_own_entry) {
    fake_egl_t fake{};
    fake.configs.emplace_back(fake_egl_t::make_config(1, 8, 8, 8, 8));
    fake.strings[EGL_VENDOR] = "fake";

    const auto cases = make_cases();
    ASSERT_EQ(cases.size(), 33u);
    for (const auto& c : cases) {
        SCOPED_TRACE(egli::get_entry_point(c.expected));
        fake.failures = {c.expected};
        const auto ec = c.invoke();
        EXPECT_EQ(ec, c.expected);
        EXPECT_EQ(fake.count(c.expected), 1);
    }
}

TEST(egl, output_untouched_on_failure) {
    fake_egl_t fake{};
    fake.failures = {call_errc::get_display, call_errc::initialize, call_errc::query_string};

    EGLDisplay display = EGL_NO_DISPLAY;
    EXPECT_EQ(egl::get_display(EGL_DEFAULT_DISPLAY, display), call_errc::get_display);
    EXPECT_EQ(display, EGL_NO_DISPLAY);

    EGLint major = -1, minor = -1;
    EXPECT_EQ(egl::initialize(fake_egl_t::get_display_handle(), major, minor), call_errc::initialize);
    EXPECT_EQ(major, -1);
    EXPECT_EQ(minor, -1);

    std::string_view text{"unchanged"};
    EXPECT_EQ(egl::query_string(fake_egl_t::get_display_handle(), EGL_VENDOR, text), call_errc::query_string);
    EXPECT_EQ(text, "unchanged");
}

TEST(egl, missing_display_is_failure) {
    fake_egl_t fake{};
    fake.has_display = false;
    EGLDisplay display = EGL_NO_DISPLAY;
    EXPECT_EQ(egl::get_display(EGL_DEFAULT_DISPLAY, display), call_errc::get_display);
}

TEST(egl, initialize_reports_version) {
    fake_egl_t fake{};
    fake.major = 1;
    fake.minor = 5;
    EGLDisplay display = EGL_NO_DISPLAY;
    ASSERT_FALSE(egl::get_display(EGL_DEFAULT_DISPLAY, display));
    EGLint major = 0, minor = 0;
    ASSERT_FALSE(egl::initialize(display, major, minor));
    EXPECT_EQ(major, 1);
    EXPECT_EQ(minor, 5);
    EXPECT_FALSE(egl::initialize(display));
    EXPECT_FALSE(egl::terminate(display));
}

TEST(egl, configs_count_then_fill) {
    fake_egl_t fake{};
    for (EGLint id = 1; id <= 3; ++id)
        fake.configs.emplace_back(fake_egl_t::make_config(id, 8, 8, 8, 8));
    const EGLDisplay display = fake_egl_t::get_display_handle();

    EGLint count = 0;
    ASSERT_FALSE(egl::num_configs(display, count));
    EXPECT_EQ(count, 3);

    std::vector<EGLConfig> configs(2, nullptr);
    EGLint written = 0;
    ASSERT_FALSE(egl::get_configs(display, configs, written));
    EXPECT_EQ(written, 2);
    EXPECT_EQ(configs[0], fake_egl_t::get_config_handle(0));
    EXPECT_EQ(configs[1], fake_egl_t::get_config_handle(1));
}

TEST(egl, query_string_requires_utf8) {
    fake_egl_t fake{};
    fake.strings[EGL_VENDOR] = "Mesa Project";
    fake.strings[EGL_VERSION] = std::string{"1.4 \xC3\x28"};
    const EGLDisplay display = fake_egl_t::get_display_handle();

    std::string_view text{};
    ASSERT_FALSE(egl::query_string(display, EGL_VENDOR, text));
    EXPECT_EQ(text, "Mesa Project");

    const auto ec = egl::query_string(display, EGL_VERSION, text);
    EXPECT_EQ(ec, egli::string_errc::invalid_utf8);
    EXPECT_EQ(text, "Mesa Project");

    // nothing for EGL_CLIENT_APIS
    EXPECT_EQ(egl::query_string(display, EGL_CLIENT_APIS, text), call_errc::query_string);
}

TEST(egl, get_error_is_only_explicit) {
    fake_egl_t fake{};
    EXPECT_EQ(egl::get_error(), EGL_SUCCESS);
    EXPECT_EQ(egl::query_api(), static_cast<EGLenum>(EGL_OPENGL_ES_API));
}

TEST(egl, utf8_validation) {
    EXPECT_TRUE(egl::is_utf8(""));
    EXPECT_TRUE(egl::is_utf8("EGL_KHR_image_base EGL_KHR_fence_sync"));
    EXPECT_TRUE(egl::is_utf8("\xC3\xA9"));         // é
    EXPECT_TRUE(egl::is_utf8("\xE2\x82\xAC"));     // €
    EXPECT_TRUE(egl::is_utf8("\xF0\x9F\x98\x80")); // U+1F600
    EXPECT_FALSE(egl::is_utf8("\xC3\x28"));
    EXPECT_FALSE(egl::is_utf8("\xC0\xAF"));         // overlong
    EXPECT_FALSE(egl::is_utf8("\xED\xA0\x80"));     // surrogate
    EXPECT_FALSE(egl::is_utf8("\xF4\x90\x80\x80")); // above U+10FFFF
    EXPECT_FALSE(egl::is_utf8("\xE2\x82"));         // truncated
    EXPECT_FALSE(egl::is_utf8("\xFF"));
}

TEST(egl, current_handles_after_make_current) {
    fake_egl_t fake{};
    fake.configs.emplace_back(fake_egl_t::make_config(1, 8, 8, 8, 8));
    const EGLDisplay display = fake_egl_t::get_display_handle();
    const EGLConfig config = fake_egl_t::get_config_handle(0);

    EGLContext context = EGL_NO_CONTEXT;
    ASSERT_FALSE(egl::create_context(display, config, EGL_NO_CONTEXT, nullptr, context));
    EGLSurface draw = EGL_NO_SURFACE, read = EGL_NO_SURFACE;
    ASSERT_FALSE(egl::create_pbuffer_surface(display, config, nullptr, draw));
    ASSERT_FALSE(egl::create_platform_window_surface(display, config, nullptr, nullptr, read));
    EXPECT_NE(read, EGL_NO_SURFACE);
    EXPECT_NE(read, draw);
    ASSERT_FALSE(egl::make_current(display, draw, read, context));

    EGLContext current_context = EGL_NO_CONTEXT;
    EXPECT_FALSE(egl::get_current_context(current_context));
    EXPECT_EQ(current_context, context);
    EGLDisplay current_display = EGL_NO_DISPLAY;
    EXPECT_FALSE(egl::get_current_display(current_display));
    EXPECT_EQ(current_display, display);
    EGLSurface current_draw = EGL_NO_SURFACE, current_read = EGL_NO_SURFACE;
    EXPECT_FALSE(egl::get_current_surface(EGL_DRAW, current_draw));
    EXPECT_FALSE(egl::get_current_surface(EGL_READ, current_read));
    EXPECT_EQ(current_draw, draw);
    EXPECT_EQ(current_read, read);

    EXPECT_FALSE(egl::bind_tex_image(display, draw, EGL_BACK_BUFFER));
    EXPECT_FALSE(egl::release_tex_image(display, draw, EGL_BACK_BUFFER));
    EXPECT_FALSE(egl::copy_buffers(display, draw, 0));
    EXPECT_FALSE(egl::wait_client());
    EXPECT_FALSE(egl::wait_gl());
    EXPECT_FALSE(egl::wait_native(EGL_CORE_NATIVE_ENGINE));

    // nothing is current after the release
    ASSERT_FALSE(egl::release_thread());
    current_context = EGL_NO_CONTEXT;
    EXPECT_EQ(egl::get_current_context(current_context), call_errc::get_current_context);
    EXPECT_EQ(current_context, EGL_NO_CONTEXT);
}
