#ifndef TUI_H
#define TUI_H

#include <ncursesw/ncurses.h>
#include <string>
#include "logger.h"
#include "pass_gen.h"

// Interactive password generator on top of ncurses.
// Owns the curses session: the constructor starts it, the destructor ends it.
class TUI {
public:
    TUI(PasswordGenerator& generator, Logger& logger, int default_length);
    ~TUI();

    TUI(const TUI&) = delete;
    TUI& operator=(const TUI&) = delete;

    void run();

private:
    PasswordGenerator& generator;
    Logger& logger;
    int default_length;

    // Window management
    WINDOW* main_win;
    WINDOW* input_win;
    WINDOW* status_win;

    // Color pairs
    enum ColorPairs {
        PAIR_DEFAULT = 1,
        PAIR_TITLE,
        PAIR_MENU,
        PAIR_SUCCESS,
        PAIR_ERROR,
        PAIR_HIGHLIGHT
    };

    WINDOW* createCenteredWindow(int height, int width);

    void showMainMenu();
    void handleGeneratePassword();
    void showPasswordGenWindow(bool& lower, bool& upper, bool& digits, bool& symbols);
    void showPassword(const std::string& password, double strength, double entropy);

    void showError(const std::string& message) const;
    void showSuccess(const std::string& message) const;

    static void centerText(WINDOW* win, int y, const std::wstring& text, int pair = PAIR_DEFAULT);
    static void centerText(WINDOW* win, int y, const std::string& text, int pair = PAIR_DEFAULT);

    // Input handling
    std::string getInput(const std::string& prompt, bool echo_input);
    int getValidNumber(int min, int max, int fallback, const std::string& prompt);
    bool confirmAction(const std::string& prompt) const;

    void refreshWindows();
    static void initColors();
};

#endif // TUI_H
