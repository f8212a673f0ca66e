#pragma once

#include "builder.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "format.hpp"
#include "measurement_store.hpp"
#include "orchestrator.hpp"
#include "report.hpp"
#include "revision_store.hpp"
#include "runner.hpp"
#include "sampler.hpp"
#include "utils.hpp"
