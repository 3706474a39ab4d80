/*
 *----------------------------------------------------------------------------
 *
 * adprovname.cpp
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
#include <sstream>


std::string PersonIdentity::display_name() const
{
    if (surname.empty()) {
        return given_name;
    }
    return given_name + " " + surname;
}


/* john.doe@corp.com -> johndoe */
std::string derive_login_name(const std::string &work_email)
{
    std::string local_part = work_email.substr(0, work_email.find('@'));
    std::string login;
    for (size_t i = 0; i < local_part.size(); i++) {
        char c = local_part[i];
        if (c == '.' || std::isspace((unsigned char) c)) {
            continue;
        }
        login += std::tolower((unsigned char) c);
    }
    return login;
}


PersonIdentity make_person_identity(const std::string &full_name,
                                    const std::string &work_email,
                                    const std::string &work_phone)
{
    PersonIdentity identity;

    std::istringstream words(full_name);
    std::string first;
    words >> first;
    std::string rest;
    std::getline(words, rest);
    size_t begin = rest.find_first_not_of(" \t");
    rest = begin == std::string::npos ? "" : rest.substr(begin);
    size_t end = rest.find_last_not_of(" \t");
    if (end != std::string::npos) {
        rest.erase(end + 1);
    }

    identity.given_name = first.empty() ? "User" : first;
    identity.surname = rest.empty() ? identity.given_name : rest;

    size_t email_begin = work_email.find_first_not_of(" \t");
    size_t email_end = work_email.find_last_not_of(" \t");
    if (email_begin != std::string::npos) {
        identity.email_address = work_email.substr(email_begin,
                                                   email_end - email_begin + 1);
    }
    identity.login_name = derive_login_name(identity.email_address);
    identity.telephone = work_phone;
    return identity;
}


void check_login_name(const std::string &login_name)
{
    if (login_name.empty()) {
        throw ProvisioningError(PROVISIONING_INVALID_IDENTITY,
                                "Login name must not be empty");
    }

    /* The sAMAccountName will cause win 9x, NT problems if longer
     * than MAX_SAM_ACCOUNT_LEN characters */
    if (login_name.length() > MAX_SAM_ACCOUNT_LEN) {
        throw ProvisioningError(PROVISIONING_INVALID_IDENTITY,
                                sform("The login name (%s) is longer than the "
                                      "maximum of %d characters",
                                      login_name.c_str(), MAX_SAM_ACCOUNT_LEN));
    }

    static const char invalid_chars[] = "\"/\\[]:;|=,+*?<>@";
    for (size_t i = 0; i < login_name.size(); i++) {
        unsigned char c = login_name[i];
        if (std::iscntrl(c) || strchr(invalid_chars, c) != NULL) {
            throw ProvisioningError(PROVISIONING_INVALID_IDENTITY,
                                    sform("The login name (%s) contains an "
                                          "invalid character",
                                          login_name.c_str()));
        }
    }
}
