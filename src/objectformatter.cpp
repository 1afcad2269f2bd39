// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <objectformatter.hpp>

#include <fmt/core.h>

#include <cstdio>
#include <iterator>

namespace quire::internal {

ObjectFormatter::ObjectFormatter(std::string_view base_indent)
    : state{std::string{base_indent}, 0, 0} {}

void ObjectFormatter::begin_array(int32_t max_element) {
    do_push(ContainerType::Array);
    state.array_elems_per_line = max_element;
}

void ObjectFormatter::begin_dict() {
    do_push(ContainerType::Dictionary);
    state.array_elems_per_line = 0;
}

void ObjectFormatter::end_array() { do_pop(ContainerType::Array); }
void ObjectFormatter::end_dict() { do_pop(ContainerType::Dictionary); }

void ObjectFormatter::do_pop(ContainerType ctype) {
    if(stack.empty()) {
        fprintf(stderr, "Object formatter stack underrun.\n");
        return;
    }
    if(stack.back().type != ctype) {
        fprintf(stderr, "Object formatter pop type mismatch.\n");
        return;
    }
    state = std::move(stack.back().params);
    stack.pop_back();
    if(!buf.empty() && buf.back() == '\n') {
        buf += state.indent;
    }
    buf += ctype == ContainerType::Dictionary ? ">>" : "]";
    added_item();
}

void ObjectFormatter::do_push(ContainerType ctype) {
    check_indent();
    stack.push_back(FormatStash{ctype, state});
    state.indent += "  ";
    state.num_entries = 0;
    buf += ctype == ContainerType::Dictionary ? "<<\n" : "[ ";
}

void ObjectFormatter::add_token_pair(const char *t1, const char *t2) {
    add_token(t1);
    add_token(t2);
}

void ObjectFormatter::add_token(const char *raw_text) { add_token(std::string_view{raw_text}); }

void ObjectFormatter::add_token(std::string_view raw_text) {
    check_indent();
    buf += raw_text;
    added_item();
}

void ObjectFormatter::add_token(int32_t number) {
    check_indent();
    fmt::format_to(std::back_inserter(buf), "{}", number);
    added_item();
}

void ObjectFormatter::add_token(uint32_t number) {
    check_indent();
    fmt::format_to(std::back_inserter(buf), "{}", number);
    added_item();
}

void ObjectFormatter::add_token(double number) {
    check_indent();
    fmt::format_to(std::back_inserter(buf), "{:.2f}", number);
    added_item();
}

void ObjectFormatter::add_token(size_t number) {
    check_indent();
    fmt::format_to(std::back_inserter(buf), "{}", number);
    added_item();
}

void ObjectFormatter::add_token_with_slash(std::string_view name) {
    check_indent();
    buf += '/';
    buf += name;
    added_item();
}

void ObjectFormatter::add_object_ref(int32_t onum) {
    check_indent();
    fmt::format_to(std::back_inserter(buf), "{} 0 R", onum);
    added_item();
}

void ObjectFormatter::check_indent() {
    if(state.num_entries == 0 && (stack.empty() || stack.back().type == ContainerType::Dictionary)) {
        buf += state.indent;
    }
}

void ObjectFormatter::added_item() {
    ++state.num_entries;
    if(stack.empty()) {
        return;
    }
    if(stack.back().type == ContainerType::Array) {
        buf += ' ';
        if(state.num_entries >= state.array_elems_per_line) {
            buf += '\n';
            buf += state.indent;
            state.num_entries = 0;
        }
    } else {
        if(state.num_entries >= 2) {
            buf += '\n';
            state.num_entries = 0;
        } else {
            buf += ' ';
        }
    }
}

std::string ObjectFormatter::steal() {
    while(!stack.empty()) {
        do_pop(stack.back().type);
    }
    if(buf.empty() || buf.back() != '\n') {
        buf += '\n';
    }
    std::string res = std::move(buf);
    buf.clear();
    state.num_entries = 0;
    return res;
}

} // namespace quire::internal
