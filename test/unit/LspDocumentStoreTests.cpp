//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "draftlint/LSP/DocumentStore.h"

bool runLspDocumentStoreTests()
{
    {
        draftlint::lsp::DocumentStore store;
        store.open("file:///tmp/notes.md", "本文です。\n", 1, "markdown");

        if (store.size() != 1)
        {
            std::cerr << "expected one open document after didOpen\n";
            return false;
        }

        const auto* firstSnapshot = store.lookup("file:///tmp/notes.md");
        if (!firstSnapshot || firstSnapshot->text != "本文です。\n" || firstSnapshot->version != 1 ||
            firstSnapshot->languageId != "markdown")
        {
            std::cerr << "unexpected snapshot after didOpen\n";
            return false;
        }

        if (!store.applyFullTextChange("file:///tmp/notes.md", "本文でした。\n", 2))
        {
            std::cerr << "expected didChange to update existing document\n";
            return false;
        }

        const auto* updatedSnapshot = store.lookup("file:///tmp/notes.md");
        if (!updatedSnapshot || updatedSnapshot->text != "本文でした。\n" || updatedSnapshot->version != 2 ||
            updatedSnapshot->languageId != "markdown")
        {
            std::cerr << "unexpected snapshot after didChange\n";
            return false;
        }

        if (store.applyFullTextChange("file:///tmp/missing.md", "bad\n", 1))
        {
            std::cerr << "didChange on missing document should fail\n";
            return false;
        }

        if (!store.close("file:///tmp/notes.md") || store.close("file:///tmp/notes.md"))
        {
            std::cerr << "expected didClose to remove an existing document once\n";
            return false;
        }

        if (store.lookup("file:///tmp/notes.md") != nullptr || store.size() != 0)
        {
            std::cerr << "document should be removed after didClose\n";
            return false;
        }
    }

    {
        if (draftlint::lsp::documentPath("file:///tmp/my%20notes/%E6%9C%AC.md") != "/tmp/my notes/本.md")
        {
            std::cerr << "file URIs should decode percent escapes\n";
            return false;
        }
        if (draftlint::lsp::documentPath("file:///tmp/100%.md") != "/tmp/100%.md")
        {
            std::cerr << "incomplete percent escapes should be kept verbatim\n";
            return false;
        }
        if (draftlint::lsp::documentPath("untitled:Untitled-1") != "untitled:Untitled-1")
        {
            std::cerr << "non-file URIs should be returned unchanged\n";
            return false;
        }
    }

    {
        using draftlint::lsp::DocumentSnapshot;
        if (!draftlint::lsp::canLint(DocumentSnapshot{"file:///tmp/a.txt", "", 1, ""}) ||
            !draftlint::lsp::canLint(DocumentSnapshot{"file:///tmp/a.markdown", "", 1, ""}) ||
            !draftlint::lsp::canLint(DocumentSnapshot{"file:///tmp/README", "", 1, "plaintext"}))
        {
            std::cerr << "text and markdown documents should be lintable\n";
            return false;
        }
        if (draftlint::lsp::canLint(DocumentSnapshot{"file:///tmp/main.rs", "", 1, "rust"}) ||
            draftlint::lsp::canLint(DocumentSnapshot{"untitled:Untitled-1", "", 1, "markdown"}))
        {
            std::cerr << "source files and untitled buffers should not be lintable\n";
            return false;
        }
        if (draftlint::lsp::fileKindOf(DocumentSnapshot{"file:///tmp/a.md", "", 1, ""}) !=
                draftlint::FileKind::Markdown ||
            draftlint::lsp::fileKindOf(DocumentSnapshot{"file:///tmp/a.txt", "", 1, "plaintext"}) !=
                draftlint::FileKind::Text)
        {
            std::cerr << "file kind should follow the extension and language id\n";
            return false;
        }
    }

    return true;
}
