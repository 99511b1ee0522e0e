/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <x11_error.h>
#include <util.h>

namespace DisplayDetect {

std::atomic<int> XErrorTrap::s_error_count {0};

XErrorTrap::XErrorTrap(Display* display)
    : m_display(display)
    , m_previous_handler(XSetErrorHandler(&XErrorTrap::HandleError))
    , m_error_count_at_start(s_error_count.load())
{}

XErrorTrap::~XErrorTrap()
{
    // Errors for requests still in flight must reach this handler, not the previous one.
    if (m_display) {
        XSync(m_display, False);
    }

    XSetErrorHandler(m_previous_handler);
}

bool XErrorTrap::HasError()
{
    if (m_display) {
        XSync(m_display, False);
    }

    return s_error_count.load() != m_error_count_at_start;
}

int XErrorTrap::HandleError(Display* display, XErrorEvent* error)
{
    ++s_error_count;

    if (!error) {
        return 0;
    }

    char error_text[256] = "unknown error";

    if (display) {
        XGetErrorText(display, error->error_code, error_text, sizeof(error_text));
    }

    log("WARNING: %s: X error: %s (code %d, request %d.%d, resource 0x%lx)",
        __func__,
        error_text,
        static_cast<int>(error->error_code),
        static_cast<int>(error->request_code),
        static_cast<int>(error->minor_code),
        static_cast<unsigned long>(error->resourceid));

    return 0;
}

} // namespace DisplayDetect
