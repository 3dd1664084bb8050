/** \brief Command-line front end of the scrape pipeline.
 *  \author The scrape_tools developers
 *
 *  \copyright 2026 The scrape_tools developers.
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

#include <iostream>
#include <memory>
#include <cstdlib>
#include <cstring>
#include "EnrichmentClient.h"
#include "HostGuard.h"
#include "ScrapeError.h"
#include "ScrapePipeline.h"
#include "ScrapeReport.h"
#include "ScrapeTools.h"
#include "StringUtil.h"
#include "util.h"


namespace {


[[noreturn]] void Usage() {
    std::cerr << "Usage: " << ::progname
              << " [--min-log-level=(ERROR|WARNING|INFO|DEBUG)] [--format=(json|csv|text)] [--no-enrichment] [--config=config_filename] url\n"
              << "       The default config file is \"" << ScrapeTools::GetDefaultConfigFilename() << "\".\n"
              << "       Enrichment is only attempted if the API key environment variable named in the config file is set.\n";
    std::exit(EXIT_FAILURE);
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    ScrapeReport::Format format(ScrapeReport::JSON);
    bool enrichment_enabled(true);
    std::string config_filename(ScrapeTools::GetDefaultConfigFilename());

    while (argc > 2) {
        if (StringUtil::StartsWith(argv[1], "--format=")) {
            if (not ScrapeReport::StringToFormat(argv[1] + std::strlen("--format="), &format))
                Usage();
        } else if (std::strcmp(argv[1], "--no-enrichment") == 0)
            enrichment_enabled = false;
        else if (StringUtil::StartsWith(argv[1], "--config="))
            config_filename = argv[1] + std::strlen("--config=");
        else
            Usage();
        --argc, ++argv;
    }
    if (argc != 2)
        Usage();
    const std::string url(argv[1]);

    const auto ini_file(LoadScrapeConfig(config_filename));
    const ScrapePipeline::Params pipeline_params(*ini_file);

    const HostGuard host_guard;
    std::unique_ptr<EnrichmentClient> enrichment_client;
    if (enrichment_enabled)
        enrichment_client.reset(new EnrichmentClient(pipeline_params.enrichment_params_));
    const ScrapePipeline pipeline(host_guard, pipeline_params.robots_params_, pipeline_params.fetcher_params_, enrichment_client.get());

    try {
        const ScrapeResult result(pipeline.scrape(url));
        std::cout << ScrapeReport::Render(result, format);
        if (format == ScrapeReport::JSON)
            std::cout << '\n';
    } catch (const ScrapeError &scrape_error) {
        std::cerr << ::progname << ": " << ScrapeError::KindToString(scrape_error.getKind()) << " ("
                  << ScrapeError::GetHttpStatus(scrape_error.getKind()) << "): " << scrape_error.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
