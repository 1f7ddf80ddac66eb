#pragma once

#include "transport.hpp"
#include "scraper_fetcher.hpp"
#include "openai.hpp"
#include "huggingface.hpp"
#include "storacha.hpp"
#include "registry_client.hpp"
#include "deposit_submitter.hpp"
