#pragma once

#include "price_quote.hpp"
#include "price_source.hpp"
#include "resolver.hpp"
#include "sources.hpp"
#include "tokens.hpp"
