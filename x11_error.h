/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef X11_ERROR_H
#define X11_ERROR_H

#include <atomic>

#include <X11/Xlib.h>

namespace DisplayDetect {

//!
//! \brief The XErrorTrap class replaces the Xlib error handler for its lifetime.
//!
//! The default Xlib handler exits the process on any protocol error. Outputs and CRTCs can disappear between two
//! requests when a monitor is unplugged, which produces BadRROutput or BadRRCrtc. While a trap is alive such errors
//! are logged and counted, and the failing request returns null to the caller instead.
//!
class XErrorTrap
{
public:
    //!
    //! \param display display whose requests are trapped. May be null, in which case HasError() does not sync.
    //!
    explicit XErrorTrap(Display* display);
    ~XErrorTrap();

    XErrorTrap(const XErrorTrap&) = delete;
    XErrorTrap& operator=(const XErrorTrap&) = delete;

    //!
    //! \brief Waits for the outstanding requests and reports whether any X error arrived since construction.
    //!
    bool HasError();

    //!
    //! \brief The installed handler. Logs the error and returns 0 so that Xlib carries on.
    //!
    static int HandleError(Display* display, XErrorEvent* error);

private:
    Display* m_display;
    XErrorHandler m_previous_handler;
    int m_error_count_at_start;

    static std::atomic<int> s_error_count;
};

} // namespace DisplayDetect

#endif // X11_ERROR_H
