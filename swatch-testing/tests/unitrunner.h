// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_TESTING_UNITRUNNER_H_INCLUDED
#define SWATCH_TESTING_UNITRUNNER_H_INCLUDED

#include <stdarg.h>
#include <stdio.h>
#include <string.h>

// UnitRunner
// ==========

//! Minimal unit testing framework used by Swatch's in-source tests.
//!
//! Units register themselves at static initialization time through `UNIT()` and are executed by `run()` ordered by
//! their group and name. A failed expectation prints where it failed and terminates the runner with a non-zero exit
//! code.
struct UnitRunner {
  //! Entry point of a unit.
  typedef void (*Entry)(void);

  //! Unit registration record.
  struct Unit {
    const char* name;
    Entry entry;
    int group;
    Unit* next;
  };

  //! Registers a unit on construction.
  struct AutoUnit : Unit {
    inline AutoUnit(const char* name_, Entry entry_, int group_) noexcept {
      name = name_;
      entry = entry_;
      group = group_;
      next = nullptr;
      UnitRunner::add(this);
    }
  };

  //! Result of a single expectation - reports the failure (with an optional message) when destroyed.
  class Check {
  public:
    const char* _file;
    int _line;
    const char* _expression;
    bool _passed;
    char _message[1024];

    inline Check(const char* file, int line, const char* expression, bool passed) noexcept
      : _file(file),
        _line(line),
        _expression(expression),
        _passed(passed) { _message[0] = '\0'; }

    Check(const Check&) = delete;
    Check& operator=(const Check&) = delete;

    inline ~Check() noexcept {
      if (!_passed)
        UnitRunner::fail(_file, _line, _expression, _message);
    }

    //! Attaches a formatted message, which is only printed on failure.
    inline Check& message(const char* fmt, ...) noexcept {
      if (!_passed) {
        va_list ap;
        va_start(ap, fmt);
        vsnprintf(_message, sizeof(_message), fmt, ap);
        va_end(ap);
      }
      return *this;
    }
  };

  static void add(Unit* unit) noexcept;
  static int run(int argc, const char* argv[]) noexcept;

  static void info(const char* fmt, ...) noexcept;
  [[noreturn]] static void fail(const char* file, int line, const char* expression, const char* message) noexcept;

  template<typename A, typename B> static inline bool eq(const A& a, const B& b) noexcept { return a == b; }
  template<typename A, typename B> static inline bool ne(const A& a, const B& b) noexcept { return !(a == b); }
  template<typename A, typename B> static inline bool lt(const A& a, const B& b) noexcept { return a < b; }
  template<typename A, typename B> static inline bool le(const A& a, const B& b) noexcept { return a <= b; }
  template<typename A, typename B> static inline bool gt(const A& a, const B& b) noexcept { return a > b; }
  template<typename A, typename B> static inline bool ge(const A& a, const B& b) noexcept { return a >= b; }
};

//! Defines a unit named `NAME`, the remaining argument is the unit's group (used to order units).
#define UNIT(NAME, ...)                                                       \
  static void unit_##NAME##_entry(void);                                      \
  static ::UnitRunner::AutoUnit unit_##NAME##_autoinit(                       \
    #NAME, unit_##NAME##_entry, __VA_ARGS__);                                 \
  static void unit_##NAME##_entry(void)

//! Prints a message, indented when called from within a unit.
#define INFO(...) ::UnitRunner::info(__VA_ARGS__)

#define UNITRUNNER_EXPECT_INTERNAL(FILE, LINE, EXPRESSION, ...) \
  ::UnitRunner::Check(FILE, LINE, EXPRESSION, bool(__VA_ARGS__))

#define EXPECT_TRUE(...) UNITRUNNER_EXPECT_INTERNAL(__FILE__, __LINE__, "EXPECT_TRUE(" #__VA_ARGS__ ")", !!(__VA_ARGS__))
#define EXPECT_FALSE(...) UNITRUNNER_EXPECT_INTERNAL(__FILE__, __LINE__, "EXPECT_FALSE(" #__VA_ARGS__ ")", !(__VA_ARGS__))

#define EXPECT_EQ(A, B) UNITRUNNER_EXPECT_INTERNAL(__FILE__, __LINE__, "EXPECT_EQ(" #A ", " #B ")", ::UnitRunner::eq(A, B))
#define EXPECT_NE(A, B) UNITRUNNER_EXPECT_INTERNAL(__FILE__, __LINE__, "EXPECT_NE(" #A ", " #B ")", ::UnitRunner::ne(A, B))
#define EXPECT_LT(A, B) UNITRUNNER_EXPECT_INTERNAL(__FILE__, __LINE__, "EXPECT_LT(" #A ", " #B ")", ::UnitRunner::lt(A, B))
#define EXPECT_LE(A, B) UNITRUNNER_EXPECT_INTERNAL(__FILE__, __LINE__, "EXPECT_LE(" #A ", " #B ")", ::UnitRunner::le(A, B))
#define EXPECT_GT(A, B) UNITRUNNER_EXPECT_INTERNAL(__FILE__, __LINE__, "EXPECT_GT(" #A ", " #B ")", ::UnitRunner::gt(A, B))
#define EXPECT_GE(A, B) UNITRUNNER_EXPECT_INTERNAL(__FILE__, __LINE__, "EXPECT_GE(" #A ", " #B ")", ::UnitRunner::ge(A, B))

#endif // SWATCH_TESTING_UNITRUNNER_H_INCLUDED
