#pragma once

#include "collaborators.hpp"
#include "content_record.hpp"
#include "orchestrator.hpp"
#include "record_store.hpp"
#include "registry_guard.hpp"
#include "resubmission.hpp"
#include "scoring.hpp"
#include "stats.hpp"
