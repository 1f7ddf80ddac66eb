#pragma once

#include "abi.hpp"
#include "address.hpp"
#include "chain_error.hpp"
#include "chain_interface.hpp"
#include "checkpoint.hpp"
#include "events.hpp"
#include "hex.hpp"
#include "poller.hpp"
#include "rlp.hpp"
#include "rpc.hpp"
#include "signer.hpp"
