#include "../h/tui.h"
#include "../h/exceptions.h"
#include <clocale>
#include <iomanip>
#include <sstream>
#include <stdexcept>

TUI::TUI(PasswordGenerator& generator, Logger& logger, int default_length)
        : generator(generator), logger(logger), default_length(default_length),
          main_win(nullptr), input_win(nullptr), status_win(nullptr) {
    Exceptions::checkLength(default_length);
    logger.debug("Starting interactive session");

    setlocale(LC_ALL, "");
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);
    initColors();

    int main_height = LINES - 6;
    int input_height = 3;
    int status_height = 3;
    if (main_height < 12 || COLS < 52) {
        endwin();
        throw std::runtime_error("Terminal is too small for interactive mode");
    }

    main_win = newwin(main_height, COLS, 0, 0);
    input_win = newwin(input_height, COLS, main_height, 0);
    status_win = newwin(status_height, COLS, main_height + input_height, 0);
    if (!main_win || !input_win || !status_win) {
        if (main_win) delwin(main_win);
        if (input_win) delwin(input_win);
        if (status_win) delwin(status_win);
        endwin();
        throw std::runtime_error("Failed to create terminal windows");
    }

    keypad(main_win, TRUE);
    keypad(input_win, TRUE);
    keypad(status_win, TRUE);
    refreshWindows();
}

TUI::~TUI() {
    delwin(main_win);
    delwin(input_win);
    delwin(status_win);
    endwin();
    logger.debug("Interactive session finished");
}

void TUI::initColors() {
    if (has_colors()) {
        start_color();
        init_pair(PAIR_DEFAULT, COLOR_WHITE, COLOR_BLACK);
        init_pair(PAIR_TITLE, COLOR_CYAN, COLOR_BLACK);
        init_pair(PAIR_MENU, COLOR_YELLOW, COLOR_BLACK);
        init_pair(PAIR_SUCCESS, COLOR_GREEN, COLOR_BLACK);
        init_pair(PAIR_ERROR, COLOR_RED, COLOR_BLACK);
        init_pair(PAIR_HIGHLIGHT, COLOR_BLUE, COLOR_BLACK);
    }
}

WINDOW* TUI::createCenteredWindow(int height, int width) {
    int start_y = (LINES - height) / 2;
    int start_x = (COLS - width) / 2;
    WINDOW* win = newwin(height, width, start_y, start_x);
    if (!win) {
        throw std::runtime_error("Failed to create terminal window");
    }
    keypad(win, TRUE);
    box(win, 0, 0);
    return win;
}

void TUI::centerText(WINDOW* win, int y, const std::wstring& text, int pair) {
    int max_x = getmaxx(win);
    int x = (max_x - static_cast<int>(text.length())) / 2;
    if (x < 0) x = 0;
    wattron(win, COLOR_PAIR(pair));
    mvwaddwstr(win, y, x, text.c_str());
    wattroff(win, COLOR_PAIR(pair));
}

void TUI::centerText(WINDOW* win, int y, const std::string& text, int pair) {
    centerText(win, y, std::wstring(text.begin(), text.end()), pair);
}

void TUI::showMainMenu() {
    wclear(main_win);
    box(main_win, 0, 0);
    centerText(main_win, 1, L"Password generator", PAIR_TITLE);
    centerText(main_win, 3, L"Enter a length, then toggle each character class", PAIR_MENU);
    centerText(main_win, 4, L"SPACE toggles, ENTER confirms", PAIR_MENU);
    wrefresh(main_win);
}

std::string TUI::getInput(const std::string& prompt, bool echo_input) {
    const int MAX_INPUT_ = 256;
    char input[MAX_INPUT_] = {0};
    werase(input_win);
    box(input_win, 0, 0);
    mvwprintw(input_win, 1, 1, "%s", prompt.c_str());
    wrefresh(input_win);
    if (echo_input) {
        echo();
        curs_set(1);
    }
    wgetnstr(input_win, input, MAX_INPUT_ - 1);
    noecho();
    curs_set(0);
    return std::string(input);
}

int TUI::getValidNumber(int min, int max, int fallback, const std::string& prompt) {
    while (true) {
        std::string input = getInput(prompt, true);
        if (input.empty()) {
            return fallback;
        }
        try {
            return Exceptions::getValidNumber(input, min, max);
        } catch (const std::invalid_argument& e) {
            showError(std::string("Invalid input: ") + e.what());
        }
    }
}

bool TUI::confirmAction(const std::string& prompt) const {
    werase(input_win);
    box(input_win, 0, 0);
    mvwprintw(input_win, 1, 1, "%s (y/n): ", prompt.c_str());
    wrefresh(input_win);
    int ch = wgetch(input_win);
    return ch == 'y' || ch == 'Y';
}

void TUI::showPasswordGenWindow(bool& lower, bool& upper, bool& digits, bool& symbols) {
    WINDOW* gen_win = createCenteredWindow(10, 50);

    mvwprintw(gen_win, 1, 2, "Password Generation Settings:");
    mvwprintw(gen_win, 3, 2, "Include lowercase? [ ]");
    mvwprintw(gen_win, 4, 2, "Include uppercase? [ ]");
    mvwprintw(gen_win, 5, 2, "Include digits?    [ ]");
    mvwprintw(gen_win, 6, 2, "Include symbols?   [ ]");

    const int y_start = 3;
    bool options[4] = {lower, upper, digits, symbols};
    curs_set(1);
    for (int i = 0; i < 4; i++) {
        mvwaddch(gen_win, y_start + i, 21, options[i] ? 'X' : ' ');
        wmove(gen_win, y_start + i, 21);
        wrefresh(gen_win);
        int ch;
        while ((ch = wgetch(gen_win)) != '\n' && ch != KEY_ENTER) {
            if (ch == ' ') {
                options[i] = !options[i];
                mvwaddch(gen_win, y_start + i, 21, options[i] ? 'X' : ' ');
                wmove(gen_win, y_start + i, 21);
                wrefresh(gen_win);
            }
        }
    }
    curs_set(0);

    lower = options[0];
    upper = options[1];
    digits = options[2];
    symbols = options[3];

    werase(gen_win);
    wrefresh(gen_win);
    delwin(gen_win);
    touchwin(main_win);
    wrefresh(main_win);
}

void TUI::showPassword(const std::string& password, double strength, double entropy) {
    wclear(main_win);
    box(main_win, 0, 0);
    centerText(main_win, 1, L"Generated password", PAIR_TITLE);
    centerText(main_win, 3, password.empty() ? std::string("(empty)") : password, PAIR_HIGHLIGHT);

    std::ostringstream details;
    details << "Strength: " << std::fixed << std::setprecision(0) << strength << "%"
            << "   Entropy: " << std::setprecision(1) << entropy << " bits";
    centerText(main_win, 5, details.str(), PAIR_MENU);
    wrefresh(main_win);
}

void TUI::handleGeneratePassword() {
    int length = getValidNumber(Exceptions::MIN_LENGTH, Exceptions::MAX_LENGTH, default_length,
                                "Password length (0-255, ENTER for " + std::to_string(default_length) + "): ");
    bool lower = true;
    bool upper = true;
    bool digits = true;
    bool symbols = false;
    showPasswordGenWindow(lower, upper, digits, symbols);

    try {
        std::string password = generator.generatePassword(length, symbols, digits, upper, lower);
        double strength = generator.getPasswordStrength(length, symbols, digits, upper, lower);
        double entropy = PasswordGenerator::getEntropyBits(length, symbols, digits, upper, lower);
        showPassword(password, strength, entropy);
        showSuccess("Password generated");
    } catch (const std::logic_error& e) {
        showError(e.what());
    }
}

void TUI::showSuccess(const std::string& message) const {
    werase(status_win);
    box(status_win, 0, 0);
    centerText(status_win, 1, message, PAIR_SUCCESS);
    wrefresh(status_win);
}

void TUI::showError(const std::string& message) const {
    werase(status_win);
    box(status_win, 0, 0);
    centerText(status_win, 1, message, PAIR_ERROR);
    wrefresh(status_win);
    wgetch(status_win);
}

void TUI::refreshWindows() {
    wrefresh(main_win);
    wrefresh(input_win);
    wrefresh(status_win);
}

void TUI::run() {
    while (true) {
        showMainMenu();
        handleGeneratePassword();
        if (!confirmAction("Generate another password?")) {
            break;
        }
        werase(status_win);
        wrefresh(status_win);
    }
}
