/** \file   Main.cc
 *  \brief  Shared main entry point of the scrape_tools programs.
 *  \author Dr. Johannes Ruscheinski (johannes.ruscheinski@uni-tuebingen.de)
 *
 *  \copyright 2018 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "Main.h"
#include <iostream>
#include <stdexcept>
#include <string>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include "ScrapeTools.h"
#include "StringUtil.h"
#include "util.h"


int Main(int argc, char *argv[]) __attribute__((weak));


int main(int argc, char *argv[]) {
    ::progname = argv[0];

    if (argc == 2 and std::strcmp(argv[1], "--version") == 0) {
        std::cout << ScrapeTools::APP_NAME << ' ' << ScrapeTools::VERSION << '\n';
        return EXIT_SUCCESS;
    }

    // Overrides the level from the MIN_LOG_LEVEL environment variable:
    if (argc > 1 and StringUtil::StartsWith(argv[1], "--min-log-level=")) {
        logger->setMinimumLogLevel(Logger::StringToLogLevel(argv[1] + std::strlen("--min-log-level=")));
        --argc, ++argv;
        argv[0] = ::progname;
    }

    try {
        errno = 0;
        return Main(argc, argv);
    } catch (const std::exception &x) {
        LOG_ERROR("caught exception: " + std::string(x.what()));
    }
}
