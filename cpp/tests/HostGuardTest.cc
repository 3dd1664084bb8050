/** \brief Test cases for HostGuard
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
#define BOOST_TEST_MODULE HostGuard
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include <map>
#include <string>
#include <vector>
#include "HostGuard.h"
#include "ScrapeError.h"
#include "Url.h"


namespace {


// Resolves a few made-up names and fails for everything else.
bool FakeResolver(const std::string &hostname, std::vector<std::string> * const ip_addresses) {
    static const std::map<std::string, std::vector<std::string>> hostnames_to_addresses_map{
        { "public.example", { "93.184.216.34" } },
        { "intranet.example", { "10.0.0.5" } },
        { "mixed.example", { "93.184.216.34", "192.168.1.1" } },
        { "v6.example", { "2606:2800:220:1:248:1893:25c8:1946" } },
        { "v6-loopback.example", { "::1" } },
        { "metadata.example", { "169.254.169.254" } },
    };

    const auto hostname_and_addresses(hostnames_to_addresses_map.find(hostname));
    if (hostname_and_addresses == hostnames_to_addresses_map.cend())
        return false;

    *ip_addresses = hostname_and_addresses->second;
    return true;
}


ScrapeError::Kind GetValidationErrorKind(const HostGuard &host_guard, const std::string &url) {
    try {
        host_guard.validate(Url(url));
    } catch (const ScrapeError &scrape_error) {
        return scrape_error.getKind();
    }

    BOOST_FAIL("expected a ScrapeError for " + url);
    return ScrapeError::INTERNAL_ERROR;
}


} // unnamed namespace


BOOST_AUTO_TEST_CASE(AllowedHosts) {
    const HostGuard host_guard(FakeResolver);
    BOOST_CHECK_NO_THROW(host_guard.validate(Url("http://public.example/")));
    BOOST_CHECK_NO_THROW(host_guard.validate(Url("https://PUBLIC.example/page")));
    BOOST_CHECK_NO_THROW(host_guard.validate(Url("http://v6.example/")));
    BOOST_CHECK_NO_THROW(host_guard.validate(Url("http://93.184.216.34/")));
    BOOST_CHECK_NO_THROW(host_guard.validate(Url("http://[2606:2800:220:1:248:1893:25c8:1946]/")));
}


BOOST_AUTO_TEST_CASE(UnresolvableHostsAreAllowed) {
    const HostGuard host_guard(FakeResolver);
    BOOST_CHECK_NO_THROW(host_guard.validate(Url("http://does-not-resolve.example/")));
}


BOOST_AUTO_TEST_CASE(InvalidSchemes) {
    const HostGuard host_guard(FakeResolver);
    BOOST_CHECK_EQUAL(GetValidationErrorKind(host_guard, "ftp://public.example/file"), ScrapeError::INVALID_SCHEME);
    BOOST_CHECK_EQUAL(GetValidationErrorKind(host_guard, "file:///etc/passwd"), ScrapeError::INVALID_SCHEME);
    BOOST_CHECK_EQUAL(GetValidationErrorKind(host_guard, "javascript:alert(1)"), ScrapeError::INVALID_SCHEME);
}


BOOST_AUTO_TEST_CASE(BlockedNames) {
    const HostGuard host_guard(FakeResolver);
    BOOST_CHECK_EQUAL(GetValidationErrorKind(host_guard, "http://localhost/"), ScrapeError::HOST_NOT_ALLOWED);
    BOOST_CHECK_EQUAL(GetValidationErrorKind(host_guard, "http://LOCALHOST:8000/"), ScrapeError::HOST_NOT_ALLOWED);
    BOOST_CHECK_EQUAL(GetValidationErrorKind(host_guard, "http://127.0.0.1/"), ScrapeError::HOST_NOT_ALLOWED);
    BOOST_CHECK_EQUAL(GetValidationErrorKind(host_guard, "http://0.0.0.0/"), ScrapeError::HOST_NOT_ALLOWED);
    BOOST_CHECK_EQUAL(GetValidationErrorKind(host_guard, "http:///no-host"), ScrapeError::HOST_NOT_ALLOWED);
}


BOOST_AUTO_TEST_CASE(NonPublicLiterals) {
    const HostGuard host_guard(FakeResolver);
    BOOST_CHECK_EQUAL(GetValidationErrorKind(host_guard, "http://10.0.0.1/"), ScrapeError::HOST_NOT_ALLOWED);
    BOOST_CHECK_EQUAL(GetValidationErrorKind(host_guard, "http://192.168.178.1/admin"), ScrapeError::HOST_NOT_ALLOWED);
    BOOST_CHECK_EQUAL(GetValidationErrorKind(host_guard, "http://127.1.2.3/"), ScrapeError::HOST_NOT_ALLOWED);
    BOOST_CHECK_EQUAL(GetValidationErrorKind(host_guard, "http://[::1]/"), ScrapeError::HOST_NOT_ALLOWED);
    BOOST_CHECK_EQUAL(GetValidationErrorKind(host_guard, "http://[fe80::1]/"), ScrapeError::HOST_NOT_ALLOWED);
    BOOST_CHECK_EQUAL(GetValidationErrorKind(host_guard, "http://224.0.0.251/"), ScrapeError::HOST_NOT_ALLOWED);
}


BOOST_AUTO_TEST_CASE(NonPublicResolutions) {
    const HostGuard host_guard(FakeResolver);
    BOOST_CHECK_EQUAL(GetValidationErrorKind(host_guard, "http://intranet.example/"), ScrapeError::HOST_NOT_ALLOWED);
    BOOST_CHECK_EQUAL(GetValidationErrorKind(host_guard, "http://mixed.example/"), ScrapeError::HOST_NOT_ALLOWED);
    BOOST_CHECK_EQUAL(GetValidationErrorKind(host_guard, "http://v6-loopback.example/"), ScrapeError::HOST_NOT_ALLOWED);
    BOOST_CHECK_EQUAL(GetValidationErrorKind(host_guard, "http://metadata.example/latest"), ScrapeError::HOST_NOT_ALLOWED);
}


BOOST_AUTO_TEST_CASE(Messages) {
    const HostGuard host_guard(FakeResolver);
    std::string reason;
    BOOST_CHECK(not host_guard.isAllowedHost("localhost", &reason));
    BOOST_CHECK_EQUAL(reason, "Local targets are not allowed.");
    BOOST_CHECK(not host_guard.isAllowedHost("intranet.example", &reason));
    BOOST_CHECK_EQUAL(reason, "Private or internal addresses are blocked.");
    BOOST_CHECK(not host_guard.isAllowedUrl(Url("gopher://public.example/"), &reason));
    BOOST_CHECK_EQUAL(reason, "Only HTTP/S URLs are supported.");
    BOOST_CHECK(host_guard.isAllowedUrl(Url("https://public.example/"), &reason));
}
