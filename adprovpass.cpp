/*
 *----------------------------------------------------------------------------
 *
 * adprovpass.cpp
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

#include <algorithm>
#include <cctype>


void wipe_password(std::string &password)
{
    std::fill(password.begin(), password.end(), '\0');
    password.clear();
}


bool password_is_complex(const std::string &password)
{
    int have_lower = 0;
    int have_upper = 0;
    int have_symbol = 0;
    int have_number = 0;

    for (size_t i = 0; i < password.size(); i++) {
        int curr = (unsigned char) password[i];
        have_symbol |= (curr >= 33 && curr <= 47);
        have_symbol |= (curr >= 91 && curr <= 96);
        have_symbol |= (curr >= 123 && curr <= 126);
        have_symbol |= (curr >= 58 && curr <= 64);
        have_number |= (curr >= 48 && curr <= 57);
        have_upper |= (curr >= 65 && curr <= 90);
        have_lower |= (curr >= 97 && curr <= 122);
    }
    return have_symbol && have_number && have_lower && have_upper;
}


static bool contains_nocase(const std::string &haystack, const std::string &needle)
{
    if (needle.empty()) {
        return false;
    }
    std::string h(haystack);
    std::string n(needle);
    for (size_t i = 0; i < h.size(); i++) {
        h[i] = std::tolower(h[i]);
    }
    for (size_t i = 0; i < n.size(); i++) {
        n[i] = std::tolower(n[i]);
    }
    return h.find(n) != std::string::npos;
}


std::string generate_new_password(size_t length, const std::string &login_name)
{
    int curr;
    int chars_used = 0;
    FILE *fp;
    std::string password(length, '\0');

    fp = fopen("/dev/urandom", "r");
    if (!fp) {
        throw Exception(sform("Error: failed to open /dev/urandom: %s",
                              strerror(errno)));
    }

    VERBOSE("Generating a new, random password for the account");
    /* The directory rejects passwords that lack a character class or that
     * contain the account name. */
    while (!password_is_complex(password) ||
           contains_nocase(password, login_name)) {
        for (size_t i = 0; i < length; i++) {
            curr = 0;
            while (curr < 33 || curr > 126) {
                if ((curr = getc(fp)) == EOF) {
                    fclose(fp);
                    wipe_password(password);
                    throw Exception("Error: failed to read from /dev/urandom");
                }
                curr &= 0x7f;
                chars_used++;
            }
            password[i] = (char) curr;
        }
    }
    fclose(fp);
    VERBOSE("Characters read from /dev/urandom: %d", chars_used);
    return password;
}


bool UnicodePwdSetter::set_password(DirectorySession &session,
                                    const std::string &dn,
                                    const std::string &login_name,
                                    const std::string &password,
                                    std::string &diagnostic)
{
    VERBOSE("Setting unicodePwd for %s", login_name.c_str());
    std::string encoded = encode_unicode_pwd(password);
    int ret = session.set_binary_attr(dn, "unicodePwd", encoded);
    std::fill(encoded.begin(), encoded.end(), '\0');
    if (ret != LDAP_SUCCESS) {
        diagnostic = ldap_err2string(ret);
        std::string diag = session.diagnostic_message();
        if (!diag.empty()) {
            diagnostic += ": " + diag;
        }
        if (ret == LDAP_UNWILLING_TO_PERFORM) {
            VERBOSE("Server refused unicodePwd; is the transport encrypted?");
        }
        return false;
    }
    return true;
}


bool KpasswdResetSetter::set_password(DirectorySession &,
                                      const std::string &,
                                      const std::string &login_name,
                                      const std::string &password,
                                      std::string &diagnostic)
{
    if (m_config.admin_user.find('=') != std::string::npos) {
        diagnostic = "administrator is configured as a DN, "
                     "not a Kerberos principal";
        return false;
    }

    std::string realm = m_config.realm();
    std::string admin_principal = m_config.admin_user.substr(
        0, m_config.admin_user.find('@')) + "@" + realm;
    std::string target_principal = login_name + "@" + realm;

    try {
        KRB5ConfFile krb5_conf(realm, m_config.server);
        KRB5Context context(krb5_conf.filename());
        KRB5Principal admin(context, admin_principal);
        KRB5Principal target(context, target_principal);

        VERBOSE("Resetting password of %s as %s via kpasswd on %s (realm %s)",
                target.name().c_str(), admin.name().c_str(),
                m_config.server.c_str(), context.default_realm().c_str());
        KRB5Creds creds(context, admin, m_config.admin_password,
                        "kadmin/changepw");

        int response = 0;
        KRB5Data resp_code_string(context);
        KRB5Data resp_string(context);
        krb5_error_code ret = krb5_set_password(context.get(),
                                                creds.get(),
                                                const_cast<char*>(password.c_str()),
                                                target.get(),
                                                &response,
                                                resp_code_string.get(),
                                                resp_string.get());
        if (ret) {
            diagnostic = sform("krb5_set_password failed: %s", error_message(ret));
            return false;
        }
        if (response) {
            diagnostic = sform("(%d) %s", response, resp_code_string.str().c_str());
            std::string detail = resp_string.str();
            if (!detail.empty()) {
                diagnostic += ": " + detail;
            }
            return false;
        }
    } catch (Exception &e) {
        diagnostic = e.what();
        return false;
    }

    VERBOSE("Successfully reset password via kpasswd");
    return true;
}
