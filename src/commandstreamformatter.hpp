// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <pdfcommon.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace quire::internal {

enum class DrawStateType : uint8_t {
    SaveState,
    Text,
};

// Accumulates the operators of one content stream. Coordinates are
// written with two decimals, color components with three.
class CommandStreamFormatter {

public:
    CommandStreamFormatter();

    void append(std::string_view line_of_text);
    void append_command(std::string_view arg, const char *command);
    void append_command(double arg, const char *command);
    void append_command(double arg1, double arg2, const char *command);
    void append_command(double arg1, double arg2, double arg3, double arg4, const char *command);
    void append_command(double arg1,
                        double arg2,
                        double arg3,
                        double arg4,
                        double arg5,
                        double arg6,
                        const char *command);
    void append_color(const Color &c, const char *command);
    void append_curve(double x1, double y1, double x2, double y2, double x3, double y3);
    void append_matrix(double a, double b, double c, double d, double e, double f);

    void BT();
    void ET();

    void q();
    // Returns false and writes nothing if there is no matching q.
    bool Q();

    // Emits the Q and ET operators needed to balance the stream.
    void close_open_states();

    // The contents as they would be after close_open_states(),
    // without modifying this object.
    std::string closed_contents() const;

private:
    void indent(DrawStateType stype);
    bool dedent(DrawStateType stype);
    bool has_state(DrawStateType stype) const;

    std::string lead;
    std::vector<DrawStateType> stack;
    std::string buf;
};

} // namespace quire::internal
