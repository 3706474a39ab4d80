/*
 *----------------------------------------------------------------------------
 *
 * adprovconf.cpp
 *
 * (C) 2004-2006 Dan Perry (dperry@pppl.gov)
 * (C) 2006 Brian Elliott Finley (finley@anl.gov)
 * (C) 2009-2010 Doug Engert (deengert@anl.gov)
 * (C) 2010 James Y Knight (foom@fuhm.net)
 * (C) 2010-2013 Ken Dreyer <ktdreyer at ktdreyer.com>
 * (C) 2012-2017 Mark Proehl <mark at mproehl.net>
 * (C) 2012-2017 Olaf Flebbe <of at oflebbe.de>
 * (C) 2013-2017 Daniel Kobras <d.kobras at science-computing.de>
 *
    This program is free software; you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation; either version 2 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program; if not, write to the Free Software
    Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA  02110-1301  USA
 *
 *-----------------------------------------------------------------------------
 */

#include "adprov.h"

#include <cctype>
#include <climits>


std::string ParameterStore::get(const std::string &key,
                                const std::string &dflt) const
{
    std::string value;
    if (get(key, value)) {
        return value;
    }
    return dflt;
}


bool MapParameterStore::get(const std::string &key, std::string &value) const
{
    std::map<std::string, std::string>::const_iterator it = m_params.find(key);
    if (it == m_params.end()) {
        return false;
    }
    value = it->second;
    return true;
}


std::string EnvParameterStore::variable_name(const std::string &key)
{
    std::string name(key);
    size_t pos = name.find('.');
    if (pos != std::string::npos) {
        name.erase(0, pos + 1);
    }
    for (std::string::iterator it = name.begin(); it != name.end(); ++it) {
        if (*it == '.') {
            *it = '_';
        } else {
            *it = std::toupper(*it);
        }
    }
    return "ADPROV_" + name;
}


bool EnvParameterStore::get(const std::string &key, std::string &value) const
{
    const char *env = getenv(variable_name(key).c_str());
    if (env == NULL) {
        return false;
    }
    value = env;
    return true;
}


static std::string trim(const std::string &s)
{
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}


static std::string lowercase(const std::string &s)
{
    std::string result(s);
    for (size_t i = 0; i < result.size(); i++) {
        result[i] = std::tolower(result[i]);
    }
    return result;
}


bool parse_bool_value(const std::string &key, const std::string &value)
{
    std::string v = lowercase(trim(value));
    if (v == "true" || v == "1" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "false" || v == "0" || v == "no" || v == "off") {
        return false;
    }
    throw ConfigError(CONFIG_INVALID_VALUE,
                      sform("Invalid boolean value '%s' for %s",
                            value.c_str(), key.c_str()));
}


static int parse_int_value(const std::string &key, const std::string &value,
                           int min, int max)
{
    std::string v = trim(value);
    char *end = NULL;
    errno = 0;
    long parsed = v.empty() ? 0 : strtol(v.c_str(), &end, 10);
    if (v.empty() || *end != '\0' || errno == ERANGE ||
        parsed < min || parsed > max) {
        throw ConfigError(CONFIG_INVALID_VALUE,
                          sform("Invalid value '%s' for %s (expected %d-%d)",
                                value.c_str(), key.c_str(), min, max));
    }
    return (int) parsed;
}


transport_mode parse_transport_mode(const std::string &value)
{
    std::string v = lowercase(trim(value));
    if (v == "ldaps") {
        return TRANSPORT_LDAPS;
    } else if (v == "starttls") {
        return TRANSPORT_STARTTLS;
    } else if (v == "plain") {
        return TRANSPORT_PLAIN;
    }
    throw ConfigError(CONFIG_INVALID_VALUE,
                      sform("Invalid transport mode '%s' for %s "
                            "(expected ldaps, starttls or plain)",
                            value.c_str(), CONF_LDAP_SECURE));
}


const char *transport_mode_name(transport_mode mode)
{
    switch (mode) {
        case TRANSPORT_LDAPS:
            return "ldaps";
        case TRANSPORT_STARTTLS:
            return "starttls";
        case TRANSPORT_PLAIN:
            return "plain";
    }
    return "unknown";
}


DirectoryConfig::DirectoryConfig() :
    transport(TRANSPORT_LDAPS),
    port(DEFAULT_LDAPS_PORT),
    validate_cert(true),
    connect_timeout(DEFAULT_CONNECT_TIMEOUT),
    password_length(DEFAULT_PASSWORD_LEN),
    password_reset_fallback(true)
{
}


std::string DirectoryConfig::base_dn() const
{
    return get_base_dn(domain);
}


std::string DirectoryConfig::realm() const
{
    std::string out(domain);
    for (size_t i = 0; i < out.size(); i++) {
        out[i] = std::toupper(out[i]);
    }
    return out;
}


DirectoryConfig resolve_config(const ParameterStore &store)
{
    DirectoryConfig config;

    config.server = trim(store.get(CONF_AD_SERVER, "localhost"));
    config.domain = trim(store.get(CONF_DOMAIN, "employee.local"));
    if (config.server.empty() || config.domain.empty()) {
        throw ConfigError(CONFIG_MISSING_REQUIRED_FIELD,
                          sform("AD server and domain must be set (%s, %s).",
                                CONF_AD_SERVER, CONF_DOMAIN));
    }
    if (config.domain[0] == '.' ||
        config.domain[config.domain.size() - 1] == '.' ||
        config.domain.find("..") != std::string::npos) {
        throw ConfigError(CONFIG_INVALID_VALUE,
                          sform("Invalid domain '%s' for %s",
                                config.domain.c_str(), CONF_DOMAIN));
    }

    config.admin_password = store.get(CONF_ADMIN_PASSWORD, "");
    if (config.admin_password.empty()) {
        throw ConfigError(CONFIG_MISSING_REQUIRED_FIELD,
                          sform("AD admin password not configured (%s).",
                                CONF_ADMIN_PASSWORD));
    }

    /* A bare login is qualified with the domain; a UPN or a DN is used as
     * given. */
    std::string admin_login = trim(store.get(CONF_ADMIN_USER, "administrator"));
    if (admin_login.empty()) {
        throw ConfigError(CONFIG_MISSING_REQUIRED_FIELD,
                          sform("AD admin user not configured (%s).",
                                CONF_ADMIN_USER));
    }
    if (admin_login.find('@') == std::string::npos &&
        admin_login.find('=') == std::string::npos) {
        config.admin_user = admin_login + "@" + config.domain;
    } else {
        config.admin_user = admin_login;
    }

    config.users_ou_dn = trim(store.get(CONF_USERS_OU, ""));
    config.ou_path = trim(store.get(CONF_OU_PATH, ""));

    config.transport = parse_transport_mode(store.get(CONF_LDAP_SECURE, "ldaps"));

    /* ldaps and the plaintext listener (plain, StartTLS) are configured
     * separately. */
    std::string value;
    const char *port_key = config.transport == TRANSPORT_LDAPS ?
                           CONF_LDAPS_PORT : CONF_LDAP_PORT;
    if (store.get(port_key, value) && !trim(value).empty()) {
        config.port = parse_int_value(port_key, value, 1, 65535);
    } else {
        config.port = config.transport == TRANSPORT_LDAPS ?
                      DEFAULT_LDAPS_PORT : DEFAULT_LDAP_PORT;
    }

    if (store.get(CONF_VALIDATE_CERT, value) && !trim(value).empty()) {
        config.validate_cert = parse_bool_value(CONF_VALIDATE_CERT, value);
    }
    config.ca_cert_file = trim(store.get(CONF_CA_CERT_FILE, ""));

    if (store.get(CONF_CONNECT_TIMEOUT, value) && !trim(value).empty()) {
        config.connect_timeout = parse_int_value(CONF_CONNECT_TIMEOUT, value,
                                                 1, INT_MAX);
    }
    if (store.get(CONF_PASSWORD_LENGTH, value) && !trim(value).empty()) {
        config.password_length = parse_int_value(CONF_PASSWORD_LENGTH, value,
                                                 MIN_PASSWORD_LEN,
                                                 MAX_PASSWORD_LEN);
    }
    if (store.get(CONF_PASSWORD_FALLBACK, value) && !trim(value).empty()) {
        config.password_reset_fallback = parse_bool_value(CONF_PASSWORD_FALLBACK,
                                                          value);
    }

    VERBOSE("Directory server: %s, domain: %s, transport: %s, port: %d",
            config.server.c_str(), config.domain.c_str(),
            transport_mode_name(config.transport), config.port);
    VERBOSE("Binding as: %s", config.admin_user.c_str());
    if (!config.validate_cert && config.transport != TRANSPORT_PLAIN) {
        VERBOSE("TLS certificate validation disabled by %s", CONF_VALIDATE_CERT);
    }
    return config;
}
