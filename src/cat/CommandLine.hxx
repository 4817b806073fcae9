// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Parse command line options.
 */

#pragma once

struct CatConfig;

void
ParseCommandLine(CatConfig &config, int argc, char **argv);
