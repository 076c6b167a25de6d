#pragma once

#include "cidgen/cid_generator.hpp"
#include "cidgen/connection_id.hpp"
#include "cidgen/error.hpp"
#include "cidgen/gnutls_crypto.hpp"
#include "cidgen/hmac_key.hpp"
#include "cidgen/opt.hpp"
#include "cidgen/utils.hpp"
