// ╺┳╸┏━┓┏┓ ╻ ╻╻  ┏━┓
//  ┃ ┣━┫┣┻┓┃ ┃┃  ┣━┫
//  ╹ ╹ ╹┗━┛┗━┛┗━╸╹ ╹
//  Random table & template generation engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Single include for the whole library
#include "tabula/util.hh"
#include "tabula/types.hh"
#include "tabula/diagnostics.hh"
#include "tabula/dice.hh"
#include "tabula/document.hh"
#include "tabula/trace.hh"
#include "tabula/context.hh"
#include "tabula/parser.hh"
#include "tabula/conditionals.hh"
#include "tabula/math.hh"
#include "tabula/tables.hh"
#include "tabula/resolver.hh"
#include "tabula/evaluator.hh"
#include "tabula/validator.hh"
#include "tabula/engine.hh"
