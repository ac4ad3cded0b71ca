#pragma once

/**
 * tokenkeys - RSA key pair provisioning for access and refresh tokens
 *
 * Umbrella header including the whole public API.
 */

#include "tokenkeys/types.hpp"
#include "tokenkeys/events.hpp"
#include "tokenkeys/platform.hpp"
#include "tokenkeys/config.hpp"
#include "tokenkeys/keygen.hpp"
#include "tokenkeys/storage.hpp"
#include "tokenkeys/env_file.hpp"
#include "tokenkeys/provisioner.hpp"
