// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <commandstreamformatter.hpp>

#include <fmt/core.h>

#include <iterator>

namespace quire::internal {

CommandStreamFormatter::CommandStreamFormatter() {}

void CommandStreamFormatter::append(std::string_view line_of_text) {
    if(!line_of_text.empty()) {
        buf += lead;
        buf += line_of_text;
        if(buf.back() != '\n') {
            buf += '\n';
        }
    }
}

void CommandStreamFormatter::append_command(std::string_view arg, const char *command) {
    buf += lead;
    buf += arg;
    buf += ' ';
    buf += command;
    buf += '\n';
}

void CommandStreamFormatter::append_command(double arg, const char *command) {
    fmt::format_to(std::back_inserter(buf), "{}{:.2f} {}\n", lead, arg, command);
}

void CommandStreamFormatter::append_command(double arg1, double arg2, const char *command) {
    fmt::format_to(std::back_inserter(buf), "{}{:.2f} {:.2f} {}\n", lead, arg1, arg2, command);
}

void CommandStreamFormatter::append_command(
    double arg1, double arg2, double arg3, double arg4, const char *command) {
    fmt::format_to(std::back_inserter(buf),
                   "{}{:.2f} {:.2f} {:.2f} {:.2f} {}\n",
                   lead,
                   arg1,
                   arg2,
                   arg3,
                   arg4,
                   command);
}

void CommandStreamFormatter::append_command(double arg1,
                                            double arg2,
                                            double arg3,
                                            double arg4,
                                            double arg5,
                                            double arg6,
                                            const char *command) {
    fmt::format_to(std::back_inserter(buf),
                   "{}{:.2f} {:.2f} {:.2f} {:.2f} {:.2f} {:.2f} {}\n",
                   lead,
                   arg1,
                   arg2,
                   arg3,
                   arg4,
                   arg5,
                   arg6,
                   command);
}

void CommandStreamFormatter::append_color(const Color &c, const char *command) {
    fmt::format_to(std::back_inserter(buf),
                   "{}{:.3f} {:.3f} {:.3f} {}\n",
                   lead,
                   c.r.v(),
                   c.g.v(),
                   c.b.v(),
                   command);
}

void CommandStreamFormatter::append_curve(
    double x1, double y1, double x2, double y2, double x3, double y3) {
    append_command(x1, y1, x2, y2, x3, y3, "c");
}

void CommandStreamFormatter::append_matrix(
    double a, double b, double c, double d, double e, double f) {
    // The linear part needs more precision than plain coordinates.
    fmt::format_to(std::back_inserter(buf),
                   "{}{:.3f} {:.3f} {:.3f} {:.3f} {:.2f} {:.2f} cm\n",
                   lead,
                   a,
                   b,
                   c,
                   d,
                   e,
                   f);
}

void CommandStreamFormatter::BT() {
    if(has_state(DrawStateType::Text)) {
        return;
    }
    append("BT");
    indent(DrawStateType::Text);
}

void CommandStreamFormatter::ET() {
    if(dedent(DrawStateType::Text)) {
        append("ET");
    }
}

void CommandStreamFormatter::q() {
    append("q");
    indent(DrawStateType::SaveState);
}

bool CommandStreamFormatter::Q() {
    if(!dedent(DrawStateType::SaveState)) {
        return false;
    }
    append("Q");
    return true;
}

void CommandStreamFormatter::close_open_states() {
    while(!stack.empty()) {
        const auto top = stack.back();
        if(top == DrawStateType::Text) {
            ET();
        } else {
            Q();
        }
    }
}

void CommandStreamFormatter::indent(DrawStateType stype) {
    stack.push_back(stype);
    lead += "  ";
}

bool CommandStreamFormatter::dedent(DrawStateType stype) {
    if(stack.empty() || stack.back() != stype) {
        return false;
    }
    stack.pop_back();
    lead.pop_back();
    lead.pop_back();
    return true;
}

bool CommandStreamFormatter::has_state(DrawStateType stype) const {
    for(const auto e : stack) {
        if(e == stype)
            return true;
    }
    return false;
}

std::string CommandStreamFormatter::closed_contents() const {
    if(stack.empty()) {
        return buf;
    }
    CommandStreamFormatter tmp(*this);
    tmp.close_open_states();
    return std::move(tmp.buf);
}

} // namespace quire::internal
