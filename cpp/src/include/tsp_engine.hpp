#pragma once
/**
 * @file tsp_engine.hpp
 * @brief Layer 3: the registration and execution engine and the suite styles.
 *
 * Includes everything below it (tsp_service.hpp) plus the engine
 * collaborators, the engines, the runner, and the styles.
 */
#include "tsp_service.hpp"

#include "engine/collaborators.hpp"
#include "engine/console_reporter.hpp"
#include "engine/errors.hpp"
#include "engine/events.hpp"
#include "engine/filter.hpp"
#include "engine/informers.hpp"
#include "engine/line_in_file.hpp"
#include "engine/message_recorder.hpp"
#include "engine/outcome.hpp"
#include "engine/path_engine.hpp"
#include "engine/run_config.hpp"
#include "engine/runner.hpp"
#include "engine/suite.hpp"
#include "engine/super_engine.hpp"

#include "styles/fixture_fun_suite.hpp"
#include "styles/flat_spec.hpp"
#include "styles/fun_spec.hpp"
#include "styles/fun_suite.hpp"
#include "styles/path_fun_spec.hpp"
#include "styles/word_spec.hpp"
