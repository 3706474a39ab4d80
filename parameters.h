/*
 *----------------------------------------------------------------------------
 *
 * parameters.h
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

#ifndef PARAMETERS_H
#define PARAMETERS_H 1

#include <map>
#include <string>

/* Named configuration parameters, read at invocation time. */
class ParameterStore {
public:
    virtual ~ParameterStore() {}

    /* Returns false if the key is not set. */
    virtual bool get(const std::string &key, std::string &value) const = 0;

    std::string get(const std::string &key, const std::string &dflt) const;
};


class MapParameterStore : public ParameterStore {
    std::map<std::string, std::string> m_params;
public:
    MapParameterStore() {}
    void set(const std::string &key, const std::string &value) {
        m_params[key] = value;
    }
    void unset(const std::string &key) {
        m_params.erase(key);
    }
    bool get(const std::string &key, std::string &value) const;
    using ParameterStore::get;
};


/* Maps "onboarding.ad_server" to the environment variable
 * ADPROV_AD_SERVER. */
class EnvParameterStore : public ParameterStore {
public:
    static std::string variable_name(const std::string &key);
    bool get(const std::string &key, std::string &value) const;
    using ParameterStore::get;
};

#endif
