/*
 *----------------------------------------------------------------------------
 *
 * krb5wrap.cpp
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

#include <errno.h>
#include <fstream>
#include <unistd.h>
#include <vector>
#ifndef HEIMDAL
#include <profile.h>
#endif

#ifndef TMP_DIR
#define TMP_DIR                         "/tmp"
#endif


KRB5ConfFile::KRB5ConfFile(const std::string &realm, const std::string &server)
{
    std::string full_template = sform("%s/.adprovkrb5.conf-XXXXXX", TMP_DIR);
    std::vector<char> template_arr(full_template.begin(), full_template.end());
    template_arr.push_back('\0');

    int fd = mkstemp(&template_arr[0]);
    if (fd < 0) {
        throw Exception(sform("Error: mkstemp failed: %s", strerror(errno)));
    }
    close(fd);
    m_filename = &template_arr[0];

    std::ofstream file(m_filename.c_str());
    file << "[libdefaults]\n"
         << " default_realm = " << realm << "\n"
         << " dns_lookup_kdc = false\n"
         << " dns_lookup_realm = false\n"
         << " udp_preference_limit = 1\n"
         << "[realms]\n"
         << " " << realm << " = {\n"
         << "  kdc = " << server << "\n"
         << "  admin_server = " << server << "\n"
         << "  kpasswd_server = " << server << "\n"
         << " }\n";
    file.close();
    if (!file) {
        unlink(m_filename.c_str());
        throw Exception(sform("Error: could not write %s", m_filename.c_str()));
    }
    VERBOSE("Created fake krb5.conf file: %s", m_filename.c_str());
}


KRB5ConfFile::~KRB5ConfFile()
{
    unlink(m_filename.c_str());
}


KRB5Context::KRB5Context() : m_context()
{
    VERBOSE("Creating Kerberos Context");
    krb5_error_code ret = krb5_init_context(&m_context);
    if (ret) {
        throw KRB5Exception("krb5_init_context", ret);
    }
}


KRB5Context::KRB5Context(const std::string &config_file) : m_context()
{
    VERBOSE("Creating Kerberos Context from %s", config_file.c_str());
#ifdef HEIMDAL
    krb5_error_code ret = krb5_init_context(&m_context);
    if (ret) {
        throw KRB5Exception("krb5_init_context", ret);
    }
    char *files[2];
    files[0] = const_cast<char *>(config_file.c_str());
    files[1] = NULL;
    ret = krb5_set_config_files(m_context, files);
    if (ret) {
        krb5_free_context(m_context);
        throw KRB5Exception("krb5_set_config_files", ret);
    }
#else
    profile_t profile = NULL;
    long perr = profile_init_path(config_file.c_str(), &profile);
    if (perr) {
        throw KRB5Exception("profile_init_path", (krb5_error_code) perr);
    }
    krb5_error_code ret = krb5_init_context_profile(profile, 0, &m_context);
    /* The context holds its own copy of the profile */
    profile_release(profile);
    if (ret) {
        throw KRB5Exception("krb5_init_context_profile", ret);
    }
#endif
}


KRB5Context::~KRB5Context()
{
    VERBOSE("Destroying Kerberos Context");
    krb5_free_context(m_context);
}


std::string KRB5Context::default_realm()
{
    char *realm = NULL;
    krb5_error_code ret = krb5_get_default_realm(m_context, &realm);
    if (ret) {
        throw KRB5Exception("krb5_get_default_realm", ret);
    }
    std::string result(realm);
#ifdef HEIMDAL
    krb5_xfree(realm);
#else
    krb5_free_default_realm(m_context, realm);
#endif
    return result;
}


KRB5Principal::KRB5Principal(KRB5Context &context,
                             const std::string &principal_name) :
    m_context(context), m_princ()
{
    krb5_error_code ret = krb5_parse_name(m_context.get(),
                                          principal_name.c_str(),
                                          &m_princ);
    if (ret) {
        throw KRB5Exception("krb5_parse_name", ret);
    }
}


std::string KRB5Principal::name()
{
    char *principal_string;
    krb5_error_code ret = krb5_unparse_name(m_context.get(),
                                            m_princ,
                                            &principal_string);
    if (ret) {
        throw KRB5Exception("krb5_unparse_name", ret);
    }

    std::string result(principal_string);

#ifdef HEIMDAL
    krb5_xfree(principal_string);
#else
    krb5_free_unparsed_name(m_context.get(), principal_string);
#endif

    return result;
}


KRB5Creds::KRB5Creds(KRB5Context &context,
                     KRB5Principal &principal,
                     const std::string &password,
                     const char *tkt_service) :
    m_context(context), m_creds()
{
    krb5_error_code ret =
        krb5_get_init_creds_password(m_context.get(),
                                     &m_creds,
                                     principal.get(),
                                     const_cast<char*>(password.c_str()),
                                     NULL,
                                     NULL,
                                     0,
                                     const_cast<char*>(tkt_service),
                                     NULL);
    if (ret) {
        throw KRB5Exception("krb5_get_init_creds_password", ret);
    }
}
