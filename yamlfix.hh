// yamlfix: canonical YAML formatter
//  version 0.1.0 | MIT License
//  Umbrella header: include this to get the whole library
#pragma once

#define YAMLFIX_VERSION "0.1.0"

#include "yamlfix_errors.hh"
#include "yamlfix_log.hh"
#include "yamlfix_config.hh"
#include "yamlfix_scan.hh"
#include "yamlfix_guard.hh"
#include "yamlfix_jinja.hh"
#include "yamlfix_tree.hh"
#include "yamlfix_emitter.hh"
#include "yamlfix_splitter.hh"
#include "yamlfix_normalizer.hh"
#include "yamlfix_passes.hh"
#include "yamlfix_fixer.hh"
