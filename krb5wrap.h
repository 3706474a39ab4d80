/*
 *----------------------------------------------------------------------------
 *
 * krb5wrap.h
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

#ifndef KRB5WRAP_H
#define KRB5WRAP_H 1

#include <krb5.h>
#include <string.h>
#include <string>

/* A private krb5.conf pointing the realm's KDC, admin and kpasswd
 * servers at one host. The file is removed on destruction and must
 * outlive any context created from it. */
class KRB5ConfFile {
    std::string m_filename;

    // make it non copyable
    KRB5ConfFile(const KRB5ConfFile&);
    const KRB5ConfFile& operator=(const KRB5ConfFile&);

public:
    KRB5ConfFile(const std::string &realm, const std::string &server);
    ~KRB5ConfFile();

    const std::string &filename() const { return m_filename; }
};

class KRB5Context {
    krb5_context m_context;

    // make it non copyable
    KRB5Context(const KRB5Context&);
    const KRB5Context& operator=(const KRB5Context&);

public:
    KRB5Context();
    /* Read configuration from config_file only, leaving the process
     * environment alone. */
    explicit KRB5Context(const std::string &config_file);
    ~KRB5Context();

    krb5_context get() { return m_context; }
    std::string default_realm();
};

class KRB5Principal {
    KRB5Context &m_context;
    krb5_principal m_princ;

    // make it non copyable
    KRB5Principal(const KRB5Principal&);
    const KRB5Principal& operator=(const KRB5Principal&);

public:
    KRB5Principal(KRB5Context &context, const std::string &principal_name);
    ~KRB5Principal() {
        if (m_princ)
            krb5_free_principal(m_context.get(), m_princ);
    }

    krb5_principal get() const { return m_princ; }
    std::string name();
};

class KRB5Creds {
    KRB5Context &m_context;
    krb5_creds m_creds;

    // make it non copyable
    KRB5Creds(const KRB5Creds&);
    const KRB5Creds& operator=(const KRB5Creds&);

public:
    KRB5Creds(KRB5Context &context, KRB5Principal &principal,
              const std::string &password, const char *tkt_service=NULL);
    ~KRB5Creds() {
        krb5_free_cred_contents(m_context.get(), &m_creds);
        memset(&m_creds, 0, sizeof(m_creds));
    }

    krb5_creds *get() { return &m_creds; }
};

class KRB5Data {
    KRB5Context &m_context;
    krb5_data m_data;

    // make it non copyable
    KRB5Data(const KRB5Data&);
    const KRB5Data& operator=(const KRB5Data&);

public:
    explicit KRB5Data(KRB5Context &context) : m_context(context) {
        /* Zero out, because the called API doesn't always set it
         * upon error conditions. */
        m_data.data = NULL;
        m_data.length = 0;
    }
    ~KRB5Data() {
        krb5_free_data_contents(m_context.get(), &m_data);
    }

    krb5_data *get() { return &m_data; }
    std::string str() const {
        return m_data.data ? std::string(m_data.data, m_data.length) : "";
    }
};

#endif
