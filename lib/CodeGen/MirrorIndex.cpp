//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the mirror type index.
///
//===----------------------------------------------------------------------===//

#include "archwith/CodeGen/MirrorIndex.h"

#include "archwith/CodeGen/AdapterLayout.h"

namespace archwith
{

MirrorIndex MirrorIndex::build(const ASTModule& module)
{
    MirrorIndex index;
    for (const auto& file : module.files)
    {
        for (const auto& decl : file.mirrors)
        {
            index.add(decl.namespaceComponents, decl.name);
        }
    }
    return index;
}

void MirrorIndex::add(const std::vector<std::string>& namespaceComponents, const std::string& name)
{
    std::string qualified;
    for (const auto& component : namespaceComponents)
    {
        qualified += component + "::";
    }
    qualified += name;
    (void) entries_.try_emplace(qualified, MirrorIndexEntry{qualified, umbrellaUnitPath(namespaceComponents, name)});
}

const MirrorIndexEntry* MirrorIndex::lookup(llvm::StringRef spelling, const std::vector<std::string>& scope) const
{
    llvm::StringRef name = spelling.take_until([](char c) { return c == '<'; }).trim();
    if (name.empty() || name.contains(' ') || name.contains('('))
    {
        return nullptr;
    }

    if (name.consume_front("::"))
    {
        const auto it = entries_.find(name);
        return it == entries_.end() ? nullptr : &it->second;
    }

    for (std::size_t depth = scope.size() + 1; depth-- > 0;)
    {
        std::string candidate;
        for (std::size_t i = 0; i < depth; ++i)
        {
            candidate += scope[i] + "::";
        }
        candidate += name.str();
        const auto it = entries_.find(candidate);
        if (it != entries_.end())
        {
            return &it->second;
        }
    }
    return nullptr;
}

}  // namespace archwith
