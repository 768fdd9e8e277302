#pragma once

namespace folio
{
    // the parts of a tab header that can receive pointer events
    enum class TabHeaderPart {
        Body,
        Label,
        CloseButton,
    };
}
