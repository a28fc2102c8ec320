/*

rewrite.cpp
-----------

Rewriting messages in memory: deleting attachments, adding the decoded subject and handling malformed messages.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <rendmail/rendmail.hpp>


using std::cout;
using std::endl;
using std::string;
using rendmail::rewrite_message;
using rendmail::rewrite_options;


int main()
{
    auto require_ok = [](auto&& res, const char* action) {
        if (!res)
        {
            std::cerr << action << " error: " << res.error().to_string() << '\n';
            return false;
        }
        return true;
    };

    const string msg =
        "From: mail io <contact@rendmail.dev>\r\n"
        "Subject: =?ISO-8859-1?Q?Photos_de_l'=E9t=E9?=\r\n"
        "MIME-Version: 1.0\r\n"
        "Content-Type: multipart/mixed; boundary=\"frontier\"\r\n"
        "\r\n"
        "--frontier\r\n"
        "Content-Type: text/plain; charset=utf-8\r\n"
        "\r\n"
        "See the attached picture.\r\n"
        "--frontier\r\n"
        "Content-Type: image/jpeg; name=\"beach.jpg\"\r\n"
        "Content-Transfer-Encoding: base64\r\n"
        "\r\n"
        "/9j/4AAQSkZJRgABAQEASABIAAD/2wBDAP//////////////////////////////////////////\r\n"
        "--frontier--\r\n";

    // The picture is replaced by an external body part stamped with the current time.
    {
        rewrite_options opts;
        opts.delete_media_types = rewrite_options::binary_delete_types();
        opts.keep_media_types = rewrite_options::binary_keep_types();
        std::istringstream in(msg);
        std::ostringstream out;
        if (!require_ok(rewrite_message(in, out, opts), "rewrite"))
            return EXIT_FAILURE;
        cout << out.str() << endl;
    }

    // The subject gets the `X-Rendmail-Subject: Photos de l'ete` companion field.
    {
        rewrite_options opts;
        opts.decode_subject = true;
        std::istringstream in(msg);
        std::ostringstream out;
        if (!require_ok(rewrite_message(in, out, opts), "rewrite"))
            return EXIT_FAILURE;
        cout << out.str() << endl;
    }

    // A truncated message is copied as it is, unless in the strict mode.
    {
        const string truncated = msg.substr(0, msg.find("--frontier--"));
        rewrite_options opts;
        opts.delete_media_types = {"image/*"};
        std::istringstream in(truncated);
        std::ostringstream out;
        if (!require_ok(rewrite_message(in, out, opts), "rewrite"))
            return EXIT_FAILURE;
        cout << out.str() << endl;

        opts.strict = true;
        std::istringstream strict_in(truncated);
        std::ostringstream strict_out;
        auto res = rewrite_message(strict_in, strict_out, opts);
        if (res)
            return EXIT_FAILURE;
        cout << "strict mode error: " << res.error().message() << endl;
    }

    return EXIT_SUCCESS;
}
