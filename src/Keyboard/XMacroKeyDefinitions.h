// SINGLE SOURCE OF TRUTH for logical keys. Should be clear and clean.
// Format: X(EnumName, StringName)
// StringName doubles as the <Name> spelling accepted by SequenceTokenizer
// for keys that have no printable character.

#define VIMNOTE_KEYS(X) \
    X(Key_A, "A") \
    X(Key_B, "B") \
    X(Key_C, "C") \
    X(Key_D, "D") \
    X(Key_E, "E") \
    X(Key_F, "F") \
    X(Key_G, "G") \
    X(Key_H, "H") \
    X(Key_I, "I") \
    X(Key_J, "J") \
    X(Key_K, "K") \
    X(Key_L, "L") \
    X(Key_M, "M") \
    X(Key_N, "N") \
    X(Key_O, "O") \
    X(Key_P, "P") \
    X(Key_Q, "Q") \
    X(Key_R, "R") \
    X(Key_S, "S") \
    X(Key_T, "T") \
    X(Key_U, "U") \
    X(Key_V, "V") \
    X(Key_W, "W") \
    X(Key_X, "X") \
    X(Key_Y, "Y") \
    X(Key_Z, "Z") \
    X(Key_0, "0") \
    X(Key_1, "1") \
    X(Key_2, "2") \
    X(Key_3, "3") \
    X(Key_4, "4") \
    X(Key_5, "5") \
    X(Key_6, "6") \
    X(Key_7, "7") \
    X(Key_8, "8") \
    X(Key_9, "9") \
    X(Key_Semicolon, "Semicolon") \
    X(Key_Comma, "Comma") \
    X(Key_Period, "Period") \
    X(Key_Slash, "Slash") \
    X(Key_Grave, "Grave") \
    X(Key_Minus, "Minus") \
    X(Key_Equal, "Equal") \
    X(Key_LBracket, "LBracket") \
    X(Key_RBracket, "RBracket") \
    X(Key_Backslash, "Backslash") \
    X(Key_Apostrophe, "Apostrophe") \
    X(Key_Esc, "Esc") \
    X(Key_Tab, "Tab") \
    X(Key_Enter, "Enter") \
    X(Key_Backspace, "Backspace") \
    X(Key_Space, "Space") \
    X(Key_Delete, "Delete") \
    X(Key_Home, "Home") \
    X(Key_End, "End") \
    X(Key_Left, "Left") \
    X(Key_Down, "Down") \
    X(Key_Up, "Up") \
    X(Key_Right, "Right")
