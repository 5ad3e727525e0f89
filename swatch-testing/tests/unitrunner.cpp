// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include "unitrunner.h"

#include <stdlib.h>

// UnitRunner - Globals
// ====================

struct UnitRunnerGlobal {
  UnitRunner::Unit* units;
  UnitRunner::Unit* current;
  size_t run_count;
};

static UnitRunnerGlobal unit_runner_global;

// UnitRunner - Utilities
// ======================

static bool unit_runner_starts_with(const char* s, const char* prefix) noexcept {
  return strncmp(s, prefix, strlen(prefix)) == 0;
}

//! Matches a unit name against a filter, which can end with '*' to match a prefix.
static bool unit_runner_matches(const char* name, const char* filter) noexcept {
  size_t filter_size = strlen(filter);
  if (filter_size > 0 && filter[filter_size - 1] == '*')
    return strncmp(name, filter, filter_size - 1) == 0;
  return strcmp(name, filter) == 0;
}

static bool unit_runner_has_arg(int argc, const char* argv[], const char* arg) noexcept {
  for (int i = 1; i < argc; i++)
    if (strcmp(argv[i], arg) == 0)
      return true;
  return false;
}

static bool unit_runner_should_run(int argc, const char* argv[], const UnitRunner::Unit* unit) noexcept {
  bool has_filter = false;
  for (int i = 1; i < argc; i++) {
    if (unit_runner_starts_with(argv[i], "--run-")) {
      has_filter = true;
      if (unit_runner_matches(unit->name, argv[i] + 6))
        return true;
    }
  }
  return !has_filter;
}

// UnitRunner - API
// ================

void UnitRunner::add(Unit* unit) noexcept {
  // Keep the list sorted by group, then by name.
  Unit** pp = &unit_runner_global.units;
  while (*pp) {
    Unit* other = *pp;
    if (unit->group < other->group || (unit->group == other->group && strcmp(unit->name, other->name) < 0))
      break;
    pp = &other->next;
  }

  unit->next = *pp;
  *pp = unit;
}

int UnitRunner::run(int argc, const char* argv[]) noexcept {
  if (unit_runner_has_arg(argc, argv, "--help")) {
    INFO("Options:\n");
    INFO("  --help         - print this usage\n");
    INFO("  --list         - list all tests\n");
    INFO("  --run-NAME     - run the test NAME (a trailing '*' matches a prefix)\n");
    return 0;
  }

  if (unit_runner_has_arg(argc, argv, "--list")) {
    for (Unit* unit = unit_runner_global.units; unit; unit = unit->next)
      INFO("%s\n", unit->name);
    return 0;
  }

  for (Unit* unit = unit_runner_global.units; unit; unit = unit->next) {
    if (!unit_runner_should_run(argc, argv, unit))
      continue;

    INFO("[Unit] %s\n", unit->name);
    unit_runner_global.current = unit;
    unit->entry();
    unit_runner_global.current = nullptr;
    unit_runner_global.run_count++;
  }

  if (unit_runner_global.run_count == 0) {
    INFO("\nNo units matched the given filter\n");
    return 1;
  }

  INFO("\nSuccess:\n  All %u tests passed\n", unsigned(unit_runner_global.run_count));
  return 0;
}

void UnitRunner::info(const char* fmt, ...) noexcept {
  if (unit_runner_global.current)
    fputs("  ", stdout);

  va_list ap;
  va_start(ap, fmt);
  vfprintf(stdout, fmt, ap);
  va_end(ap);

  size_t size = strlen(fmt);
  if (unit_runner_global.current && (size == 0 || fmt[size - 1] != '\n'))
    fputs("\n", stdout);
  fflush(stdout);
}

void UnitRunner::fail(const char* file, int line, const char* expression, const char* message) noexcept {
  fprintf(stdout, "  FAILED: %s\n", expression);
  if (message && message[0])
    fprintf(stdout, "  REASON: %s\n", message);
  fprintf(stdout, "  SOURCE: %s (Line: %d)\n", file, line);
  fflush(stdout);
  exit(1);
}
